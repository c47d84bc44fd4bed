#pragma once
/*
 * ChildProcess
 *
 * A forked/exec'd command whose stdout and stderr share one pipe. The read
 * end is a non-blocking asio stream descriptor so the multiplexer can take
 * one byte at a time without ever blocking.
 */
#include <asio.hpp>

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <sys/types.h>
#include <vector>

#include "byte_source.hpp"
#include "log.hpp"

class SpawnError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class ChildProcess : public ByteSource {
public:
  // Throws SpawnError when the pipe, fork or exec fails.
  static std::unique_ptr<ChildProcess> spawn(asio::io_context& io,
                                             const std::vector<std::string>& argv,
                                             std::shared_ptr<Logger> logger = nullptr);

  ~ChildProcess() override;

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  ProcessStatus poll_status() override;
  ReadResult try_read_byte() override;

  // Blocks until the child has exited. Returns its exit code, or 128 plus
  // the signal number when it was killed by a signal.
  int wait();
  // Sends SIGTERM if the child has not been reaped yet. Safe to call from
  // another thread while the owner polls or waits.
  void terminate();

  pid_t pid() const { return pid_; }
  const std::string& command() const { return command_; }

private:
  ChildProcess(asio::io_context& io, pid_t pid, int read_fd,
               std::string command, std::shared_ptr<Logger> logger);

  // Callers hold reap_mutex_.
  void record_status(int status);
  void reap_locked(int options);

  asio::posix::stream_descriptor output_;
  pid_t pid_;
  std::string command_;
  std::shared_ptr<Logger> logger_;

  // Reaping and kill() are serialized so a signal never reaches a pid that
  // was already reaped and possibly reused.
  std::mutex reap_mutex_;
  bool reaped_ = false;
  int exit_code_ = -1;
};
