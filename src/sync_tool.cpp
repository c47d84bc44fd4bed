#include "sync_tool.hpp"

#include <csignal>
#include <string>

#include "ansi_style.hpp"
#include "child_process.hpp"
#include "cursor_tool.hpp"
#include "stream_multiplexer.hpp"
#include "ui_session.hpp"

namespace {

constexpr int kInterruptedExitCode = 130;

std::string join_hosts(const std::vector<std::string>& hosts) {
  std::string out;
  for(const auto& host : hosts) {
    if(!out.empty()) out += ", ";
    out += host;
  }
  return out;
}

std::string banner(const std::string& text, std::string (*style)(const std::string&)) {
  const std::string border(text.size() + 4, '#');
  return style(border) + "\n" + style("# " + text + " #") + "\n" + style(border) + "\n";
}

} // namespace

SyncTool::SyncTool(ServerProfile profile,
                   SyncPlan plan,
                   Options options,
                   RunHistory history,
                   std::ostream& out,
                   std::istream& in,
                   std::shared_ptr<Logger> logger)
  : profile_(std::move(profile)),
    plan_(std::move(plan)),
    options_(std::move(options)),
    history_(std::move(history)),
    out_(out),
    in_(in),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("sync-tool")) {}

SyncTool::~SyncTool() {
  remove_signal_handler();
}

int SyncTool::run() {
  print_intro();
  print_commands();
  if(!options_.assume_yes && !confirm()) {
    out_ << "Aborted\n";
    return 1;
  }

  CursorTool(out_).clear_screen();
  print_summary();

  install_signal_handler();
  spawn_transfers();
  show_progress();
  int exit_code = collect_exit_codes();
  remove_signal_handler();

  if(interrupted_.load()) {
    logger_->warn("sync interrupted");
    return kInterruptedExitCode;
  }

  record_run();
  history_.print_last(out_);
  return exit_code;
}

void SyncTool::print_intro() {
  CursorTool(out_).clear_screen();

  if(options_.sync.delete_extraneous) {
    out_ << banner("Delete option is enabled", ansi::yellow_block);
  }
  if(options_.sync.back) {
    out_ << banner("Back option is enabled", ansi::red_block);
  }

  history_.print_last(out_);

  const std::string local = "local";
  const std::string remote = join_hosts(plan_.hosts);
  const auto& src = options_.sync.back ? remote : local;
  const auto& dst = options_.sync.back ? local : remote;
  out_ << "Syncing folder " << ansi::blue_block(plan_.relative_path.string())
       << " from " << ansi::blue_block(src) << " -> " << ansi::blue_block(dst) << "\n";
  out_.flush();
}

void SyncTool::print_commands() {
  for(const auto& command : plan_.commands) {
    out_ << "Executing: " << ansi::green_block(join_command(command)) << "\n";
  }
  out_.flush();
}

bool SyncTool::confirm() {
  out_ << "Press Enter to continue...";
  out_.flush();
  std::string line;
  return static_cast<bool>(std::getline(in_, line));
}

void SyncTool::print_summary() {
  out_ << "Syncing local folder " << ansi::blue_block(plan_.relative_path.string())
       << " with remote hosts " << ansi::blue_block("[" + join_hosts(plan_.hosts) + "]") << "\n"
       << "(delete=" << std::boolalpha << options_.sync.delete_extraneous << ")\n"
       << "(back=" << options_.sync.back << ")\n"
       << "(git_repo=" << options_.sync.git_repo << ")\n"
       << "(server=" << profile_.name << ")\n"
       << std::noboolalpha
       << std::string(68, '=') << "\n";
  out_.flush();
}

void SyncTool::spawn_transfers() {
  for(const auto& command : plan_.commands) {
    auto transfer = ChildProcess::spawn(io_, command, logger_);
    std::lock_guard<std::mutex> lock(transfers_mutex_);
    if(interrupted_.load()) transfer->terminate();
    transfers_.push_back(std::move(transfer));
  }
}

void SyncTool::interrupt() {
  interrupted_.store(true);
  std::lock_guard<std::mutex> lock(transfers_mutex_);
  for(auto& transfer : transfers_) transfer->terminate();
}

void SyncTool::show_progress() {
  std::vector<ByteSource*> sources;
  sources.reserve(transfers_.size());
  for(auto& transfer : transfers_) sources.push_back(transfer.get());

  StreamMultiplexer::Options mux_options;
  mux_options.idle_sleep = options_.idle_sleep;
  mux_options.drain_after_exit = options_.drain_on_exit;

  StreamMultiplexer multiplexer(std::move(sources), mux_options, logger_);
  MultiplexStats stats;
  {
    UISession session(out_, static_cast<int>(transfers_.size()),
                      UISession::kDefaultDescription, logger_);
    stats = multiplexer.run(session.canvas());
  }
  for(std::size_t i = 0; i < stats.bytes_per_line.size(); ++i) {
    log_debug(logger_.get(), "{}: {} bytes of progress output", plan_.hosts[i], stats.bytes_per_line[i]);
  }
}

int SyncTool::collect_exit_codes() {
  int result = 0;
  for(std::size_t i = 0; i < transfers_.size(); ++i) {
    int code = transfers_[i]->wait();
    if(code != 0) {
      logger_->error("rsync to {} exited with {}", plan_.hosts[i], code);
      result = 1;
    }
  }
  return result;
}

void SyncTool::record_run() {
  RunRecord record;
  record.path = plan_.relative_path.generic_string();
  record.hosts = plan_.hosts;
  record.back = options_.sync.back;
  record.delete_extraneous = options_.sync.delete_extraneous;
  record.git_repo = options_.sync.git_repo;
  if(!history_.append(std::move(record))) {
    logger_->warn("run not recorded in {}", history_.file().string());
  }
}

// Ctrl-C reaches the rsync children as well, but a SIGTERM sent to lsync
// alone would not; forward it so the progress loop sees every transfer end.
// Installed before spawning so no transfer escapes an early signal.
void SyncTool::install_signal_handler() {
  signals_ = std::make_unique<asio::signal_set>(io_, SIGINT, SIGTERM);
  wait_for_signal();
  signal_thread_ = std::thread([this]{ io_.run(); });
}

void SyncTool::wait_for_signal() {
  signals_->async_wait([this](const std::error_code& ec, int signo) {
    if(ec) return;
    log_debug(logger_.get(), "signal {} forwarded to the transfers", signo);
    interrupt();
    wait_for_signal();
  });
}

void SyncTool::remove_signal_handler() {
  if(!signals_) return;
  std::error_code ec;
  signals_->cancel(ec);
  io_.stop();
  if(signal_thread_.joinable()) signal_thread_.join();
  signals_.reset();
}
