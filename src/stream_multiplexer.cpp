#include "stream_multiplexer.hpp"

#include <thread>

#include "ui_canvas.hpp"

StreamMultiplexer::StreamMultiplexer(std::vector<ByteSource*> sources,
                                     Options options,
                                     std::shared_ptr<Logger> logger)
  : sources_(std::move(sources)),
    exhausted_(sources_.size(), false),
    exited_(sources_.size(), false),
    options_(options),
    logger_(std::move(logger)) {
  for(auto* source : sources_) {
    if(!source) throw UsageError("null byte source");
  }
}

bool StreamMultiplexer::all_exited() {
  bool all = true;
  for(std::size_t i = 0; i < sources_.size(); ++i) {
    if(exited_[i]) continue;
    if(sources_[i]->poll_status() == ProcessStatus::Exited) {
      exited_[i] = true;
      log_debug(logger_.get(), "stream {} exited", i);
    } else {
      all = false;
    }
  }
  return all;
}

MultiplexStats StreamMultiplexer::run(UICanvas& canvas) {
  if(static_cast<int>(sources_.size()) > canvas.line_count()) {
    throw UsageError("more byte sources than canvas lines");
  }

  MultiplexStats stats;
  stats.bytes_per_line.assign(sources_.size(), 0);

  while(!all_exited()) {
    if(options_.cancel && options_.cancel->load(std::memory_order_acquire)) {
      stats.cancelled = true;
      log_debug(logger_.get(), "multiplexer cancelled after {} iterations", stats.iterations);
      return stats;
    }

    bool routed_any = false;
    for(std::size_t i = 0; i < sources_.size(); ++i) {
      if(exhausted_[i]) continue;
      auto result = sources_[i]->try_read_byte();
      switch(result.kind) {
        case ReadResult::Kind::Byte:
          canvas.update_char(static_cast<int>(i), result.byte);
          stats.bytes_per_line[i]++;
          routed_any = true;
          break;
        case ReadResult::Kind::EndOfStream:
          exhausted_[i] = true;
          log_debug(logger_.get(), "stream {} reached end of output", i);
          break;
        case ReadResult::Kind::None:
          break;
      }
    }
    stats.iterations++;

    if(!routed_any && options_.idle_sleep.count() > 0) {
      std::this_thread::sleep_for(options_.idle_sleep);
    }
  }

  if(options_.drain_after_exit) {
    drain(canvas, stats);
  }
  return stats;
}

void StreamMultiplexer::drain(UICanvas& canvas, MultiplexStats& stats) {
  for(std::size_t i = 0; i < sources_.size(); ++i) {
    while(!exhausted_[i]) {
      auto result = sources_[i]->try_read_byte();
      if(result.kind == ReadResult::Kind::EndOfStream) {
        exhausted_[i] = true;
      } else if(result.kind == ReadResult::Kind::None) {
        break;
      } else {
        canvas.update_char(static_cast<int>(i), result.byte);
        stats.bytes_per_line[i]++;
        stats.drained_bytes++;
      }
    }
  }
}
