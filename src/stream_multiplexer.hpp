#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <vector>

#include "byte_source.hpp"
#include "log.hpp"

class UICanvas;

struct MultiplexStats {
  std::vector<std::size_t> bytes_per_line;
  std::size_t iterations = 0;
  std::size_t drained_bytes = 0; // routed by the final drain pass
  bool cancelled = false;
};

// Routes the output of N processes to lines 0..N-1 of a canvas, one byte per
// process per iteration in index order, until every process has exited.
class StreamMultiplexer {
public:
  struct Options {
    // Sleep after an iteration in which no stream produced a byte.
    // Zero busy-polls.
    std::chrono::microseconds idle_sleep{1000};
    // After all processes exited, keep reading each stream until it runs dry
    // so trailing output is shown instead of dropped.
    bool drain_after_exit = false;
    // Checked once per iteration; when set the loop returns early.
    const std::atomic<bool>* cancel = nullptr;
  };

  StreamMultiplexer(std::vector<ByteSource*> sources,
                    Options options,
                    std::shared_ptr<Logger> logger = nullptr);

  MultiplexStats run(UICanvas& canvas);

private:
  bool all_exited();
  void drain(UICanvas& canvas, MultiplexStats& stats);

  std::vector<ByteSource*> sources_;
  std::vector<bool> exhausted_;
  std::vector<bool> exited_;
  Options options_;
  std::shared_ptr<Logger> logger_;
};
