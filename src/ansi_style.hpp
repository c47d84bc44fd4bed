#pragma once

#include <spdlog/fmt/fmt.h>

#include <string>

namespace ansi {

inline std::string wrap(const char* sgr, const std::string& text) {
  return fmt::format("\x1b[{}m{}\x1b[0m", sgr, text);
}

inline std::string red_block(const std::string& text) { return wrap("41", text); }
inline std::string green_block(const std::string& text) { return wrap("42", text); }
inline std::string yellow_block(const std::string& text) { return wrap("43", text); }
inline std::string blue_block(const std::string& text) { return wrap("44", text); }
inline std::string yellow_text(const std::string& text) { return wrap("33", text); }

} // namespace ansi
