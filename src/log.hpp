#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

// Diagnostics (warn/error/debug) go to stderr with a timestamp; print_out and
// print_err write plain lines to stdout and stderr.
void init(bool verbose = false);
void set_log_passthrough(bool enabled);
bool log_passthrough();

using LogListenerHandle = std::size_t;

class Logger {
public:
  // Return true to keep the message off the console.
  using Listener = std::function<bool(const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  explicit Logger(std::string name);

  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(spdlog::level::warn, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(spdlog::level::err, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(spdlog::level::debug, fmt::format(fmt, std::forward<Args>(args)...));
  }

private:
  void log(spdlog::level::level_enum level, const std::string& message);
  bool dispatch(spdlog::level::level_enum level, const std::string& message);

  std::string name_;
  std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, Listener> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

// Turns console passthrough off for its lifetime and restores the previous
// value afterwards. Listeners still receive every message.
class ScopedLogSilence {
public:
  ScopedLogSilence() : previous_(log_passthrough()) { set_log_passthrough(false); }
  ~ScopedLogSilence() { set_log_passthrough(previous_); }

  ScopedLogSilence(const ScopedLogSilence&) = delete;
  ScopedLogSilence& operator=(const ScopedLogSilence&) = delete;

private:
  bool previous_;
};

namespace detail {
enum class Sink { Diagnostic, PlainOut, PlainErr };

void emit(Sink sink,
          spdlog::level::level_enum level,
          const std::string& channel,
          const std::string& message);
} // namespace detail

// Free helpers for code without a Logger at hand.
template<typename... Args>
inline void log_warn(Logger* logger,
                     spdlog::format_string_t<Args...> fmt,
                     Args&&... args) {
  if(logger) {
    logger->warn(fmt, std::forward<Args>(args)...);
  } else {
    detail::emit(detail::Sink::Diagnostic, spdlog::level::warn, std::string(),
                 fmt::format(fmt, std::forward<Args>(args)...));
  }
}

template<typename... Args>
inline void log_debug(Logger* logger,
                      spdlog::format_string_t<Args...> fmt,
                      Args&&... args) {
  if(logger) {
    logger->debug(fmt, std::forward<Args>(args)...);
  } else {
    detail::emit(detail::Sink::Diagnostic, spdlog::level::debug, std::string(),
                 fmt::format(fmt, std::forward<Args>(args)...));
  }
}

template<typename... Args>
inline void print_out(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::emit(detail::Sink::PlainOut, spdlog::level::info, std::string(),
               fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::emit(detail::Sink::PlainErr, spdlog::level::err, std::string(),
               fmt::format(fmt, std::forward<Args>(args)...));
}
