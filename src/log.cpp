#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace {

struct Sinks {
  std::shared_ptr<spdlog::logger> diagnostic;
  std::shared_ptr<spdlog::logger> plain_out;
  std::shared_ptr<spdlog::logger> plain_err;
};

std::once_flag g_sinks_once;
Sinks g_sinks;
std::atomic<bool> g_log_passthrough{true};

Sinks& sinks() {
  std::call_once(g_sinks_once, [](){
    auto diagnostic_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    diagnostic_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    auto out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    out_sink->set_pattern("%v");
    auto err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    err_sink->set_pattern("%v");

    g_sinks.diagnostic = std::make_shared<spdlog::logger>("lsync", std::move(diagnostic_sink));
    g_sinks.plain_out = std::make_shared<spdlog::logger>("lsync.out", std::move(out_sink));
    g_sinks.plain_err = std::make_shared<spdlog::logger>("lsync.err", std::move(err_sink));

    g_sinks.diagnostic->set_level(spdlog::level::info);
    g_sinks.diagnostic->flush_on(spdlog::level::warn);
    g_sinks.plain_out->flush_on(spdlog::level::info);
    g_sinks.plain_err->flush_on(spdlog::level::err);
  });
  return g_sinks;
}

} // namespace

void init(bool verbose) {
  auto& s = sinks();
  s.diagnostic->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
  spdlog::set_default_logger(s.diagnostic);
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

Logger::Logger(std::string name) : name_(std::move(name)) {}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::log(spdlog::level::level_enum level, const std::string& message) {
  if(dispatch(level, message)) return;
  detail::emit(detail::Sink::Diagnostic, level, name_, message);
}

bool Logger::dispatch(spdlog::level::level_enum level, const std::string& message) {
  std::vector<Listener> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) snapshot.push_back(entry.second);
  }
  bool handled = false;
  for(auto& listener : snapshot) {
    try {
      if(listener(name_, level, message)) handled = true;
    } catch(const std::exception& e) {
      detail::emit(detail::Sink::Diagnostic, spdlog::level::err, name_,
                   fmt::format("log listener failed: {}", e.what()));
    }
  }
  return handled;
}

namespace detail {

void emit(Sink sink,
          spdlog::level::level_enum level,
          const std::string& channel,
          const std::string& message) {
  if(!log_passthrough()) return;
  auto& s = sinks();
  switch(sink) {
    case Sink::PlainOut:
      s.plain_out->log(level, message);
      break;
    case Sink::PlainErr:
      s.plain_err->log(level, message);
      break;
    case Sink::Diagnostic:
      if(channel.empty()) {
        s.diagnostic->log(level, message);
      } else {
        s.diagnostic->log(level, fmt::format("[{}] {}", channel, message));
      }
      break;
  }
}

} // namespace detail
