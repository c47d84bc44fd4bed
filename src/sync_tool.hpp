#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <istream>
#include <memory>
#include <mutex>
#include <ostream>
#include <thread>
#include <vector>

#include "log.hpp"
#include "run_history.hpp"
#include "server_config.hpp"
#include "sync_plan.hpp"

class ChildProcess;

// Drives one sync: shows what is about to happen, runs one rsync per host
// with live progress lines, and records the run.
class SyncTool {
public:
  struct Options {
    SyncOptions sync;
    bool assume_yes = false;
    bool drain_on_exit = false;
    std::chrono::microseconds idle_sleep{1000};
  };

  SyncTool(ServerProfile profile,
           SyncPlan plan,
           Options options,
           RunHistory history,
           std::ostream& out,
           std::istream& in,
           std::shared_ptr<Logger> logger = nullptr);
  ~SyncTool();

  // Returns the process exit code: 0 when every transfer succeeded, 1 when
  // one failed or the prompt was declined, 130 when interrupted.
  int run();

  // Terminates every transfer and marks the run as interrupted. Called from
  // the signal thread; safe from any thread.
  void interrupt();

private:
  void print_intro();
  void print_commands();
  bool confirm();
  void print_summary();
  void spawn_transfers();
  void show_progress();
  int collect_exit_codes();
  void record_run();
  void install_signal_handler();
  void wait_for_signal();
  void remove_signal_handler();

  ServerProfile profile_;
  SyncPlan plan_;
  Options options_;
  RunHistory history_;
  std::ostream& out_;
  std::istream& in_;
  std::shared_ptr<Logger> logger_;

  asio::io_context io_;
  std::unique_ptr<asio::signal_set> signals_;
  std::thread signal_thread_;
  std::atomic<bool> interrupted_{false};
  std::mutex transfers_mutex_;
  std::vector<std::unique_ptr<ChildProcess>> transfers_;
};
