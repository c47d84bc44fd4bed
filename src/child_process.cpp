#include "child_process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "sync_plan.hpp"

namespace {

void close_fd(int& fd) {
  if(fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

// Read end of the exec status pipe: empty on a successful exec, otherwise
// the child's errno.
int read_exec_errno(int fd) {
  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(fd, &child_errno, sizeof(child_errno));
  } while(n < 0 && errno == EINTR);
  return n == static_cast<ssize_t>(sizeof(child_errno)) ? child_errno : 0;
}

} // namespace

std::unique_ptr<ChildProcess> ChildProcess::spawn(asio::io_context& io,
                                                  const std::vector<std::string>& argv,
                                                  std::shared_ptr<Logger> logger) {
  if(argv.empty()) {
    throw SpawnError("empty command line");
  }
  const auto command = join_command(argv);

  int output[2] = {-1, -1};
  if(::pipe2(output, O_CLOEXEC) != 0) {
    throw SpawnError("pipe failed for '" + command + "': " + std::strerror(errno));
  }
  int status[2] = {-1, -1};
  if(::pipe2(status, O_CLOEXEC) != 0) {
    int err = errno;
    close_fd(output[0]);
    close_fd(output[1]);
    throw SpawnError("pipe failed for '" + command + "': " + std::strerror(err));
  }

  std::vector<char*> raw_argv;
  raw_argv.reserve(argv.size() + 1);
  for(const auto& arg : argv) raw_argv.push_back(const_cast<char*>(arg.c_str()));
  raw_argv.push_back(nullptr);

  pid_t pid = ::fork();
  if(pid < 0) {
    int err = errno;
    close_fd(output[0]);
    close_fd(output[1]);
    close_fd(status[0]);
    close_fd(status[1]);
    throw SpawnError("fork failed for '" + command + "': " + std::strerror(err));
  }

  if(pid == 0) {
    ::dup2(output[1], STDOUT_FILENO);
    ::dup2(output[1], STDERR_FILENO);
    ::execvp(raw_argv[0], raw_argv.data());
    int err = errno;
    ssize_t ignored = ::write(status[1], &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
  }

  close_fd(output[1]);
  close_fd(status[1]);
  int child_errno = read_exec_errno(status[0]);
  close_fd(status[0]);
  if(child_errno != 0) {
    close_fd(output[0]);
    int wstatus = 0;
    while(::waitpid(pid, &wstatus, 0) < 0 && errno == EINTR) {}
    throw SpawnError("exec failed for '" + command + "': " + std::strerror(child_errno));
  }

  log_debug(logger.get(), "spawned pid {}: {}", pid, command);
  return std::unique_ptr<ChildProcess>(
    new ChildProcess(io, pid, output[0], command, std::move(logger)));
}

ChildProcess::ChildProcess(asio::io_context& io, pid_t pid, int read_fd,
                           std::string command, std::shared_ptr<Logger> logger)
  : output_(io, read_fd),
    pid_(pid),
    command_(std::move(command)),
    logger_(std::move(logger)) {
  output_.non_blocking(true);
}

ChildProcess::~ChildProcess() {
  terminate();
  wait();
  std::error_code ec;
  output_.close(ec);
}

void ChildProcess::record_status(int status) {
  if(WIFEXITED(status)) {
    exit_code_ = WEXITSTATUS(status);
  } else if(WIFSIGNALED(status)) {
    exit_code_ = 128 + WTERMSIG(status);
  }
  reaped_ = true;
}

void ChildProcess::reap_locked(int options) {
  int status = 0;
  pid_t result;
  do {
    result = ::waitpid(pid_, &status, options);
  } while(result < 0 && errno == EINTR);

  if(result == pid_) {
    record_status(status);
    log_debug(logger_.get(), "pid {} exited with {}", pid_, exit_code_);
  } else if(result < 0) {
    // Someone else reaped it; its exit code is lost.
    log_warn(logger_.get(), "waitpid({}) failed: {}", pid_, std::strerror(errno));
    reaped_ = true;
  }
}

ProcessStatus ChildProcess::poll_status() {
  std::lock_guard<std::mutex> lock(reap_mutex_);
  if(!reaped_) reap_locked(WNOHANG);
  return reaped_ ? ProcessStatus::Exited : ProcessStatus::Running;
}

ReadResult ChildProcess::try_read_byte() {
  if(!output_.is_open()) return ReadResult::end_of_stream();

  char ch = 0;
  std::error_code ec;
  std::size_t n = output_.read_some(asio::buffer(&ch, 1), ec);
  if(!ec && n == 1) return ReadResult::of(ch);
  if(ec == asio::error::eof) return ReadResult::end_of_stream();
  if(ec && ec != asio::error::would_block && ec != asio::error::try_again &&
     ec != asio::error::interrupted) {
    log_debug(logger_.get(), "read from pid {} failed: {}", pid_, ec.message());
  }
  return ReadResult::none();
}

int ChildProcess::wait() {
  {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if(reaped_) return exit_code_;
  }

  // Block until the child is a zombie without reaping it, so terminate()
  // stays usable meanwhile and the pid cannot be reused.
  siginfo_t info{};
  while(::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) < 0 && errno == EINTR) {}

  std::lock_guard<std::mutex> lock(reap_mutex_);
  if(!reaped_) reap_locked(0);
  return exit_code_;
}

void ChildProcess::terminate() {
  std::lock_guard<std::mutex> lock(reap_mutex_);
  if(reaped_) return;
  if(::kill(pid_, SIGTERM) != 0 && errno != ESRCH) {
    log_warn(logger_.get(), "kill({}) failed: {}", pid_, std::strerror(errno));
  }
}
