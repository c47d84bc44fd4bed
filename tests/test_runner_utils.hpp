#pragma once

#include "byte_source.hpp"
#include "log.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace lsync::test {

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener(
      [this, label](const std::string& channel,
                    spdlog::level::level_enum,
                    const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.emplace_back((label.empty() ? channel : label) + ": " + message);
        return true;
      });
    attachments_.push_back({logger, handle});
  }

  void detach_all() {
    for(auto& attachment : attachments_) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
    }
    attachments_.clear();
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

private:
  struct Attachment {
    std::shared_ptr<Logger> logger;
    LogListenerHandle handle = 0;
  };

  mutable std::mutex mutex_;
  std::vector<std::string> lines_;
  std::vector<Attachment> attachments_;
};

// Byte source that replays a fixed script.
class ScriptedSource : public ByteSource {
public:
  explicit ScriptedSource(std::string data) : data_(std::move(data)) {}

  // Report Exited from the given poll on (1-based), whatever is left unread.
  ScriptedSource& exit_on_poll(int poll) { exit_on_poll_ = poll; return *this; }
  // Every nth read attempt yields None, like a read that failed.
  ScriptedSource& fail_every(int n) { fail_every_ = n; return *this; }
  // After the data, report None instead of EndOfStream.
  ScriptedSource& without_eof() { eof_ = false; return *this; }
  ScriptedSource& never_exit() { never_exit_ = true; return *this; }

  ProcessStatus poll_status() override {
    ++polls_;
    if(never_exit_) return ProcessStatus::Running;
    if(exit_on_poll_ > 0) {
      return polls_ >= exit_on_poll_ ? ProcessStatus::Exited : ProcessStatus::Running;
    }
    return pos_ >= data_.size() ? ProcessStatus::Exited : ProcessStatus::Running;
  }

  ReadResult try_read_byte() override {
    ++reads_;
    if(fail_every_ > 0 && reads_ % fail_every_ == 0) return ReadResult::none();
    if(pos_ < data_.size()) return ReadResult::of(data_[pos_++]);
    return eof_ ? ReadResult::end_of_stream() : ReadResult::none();
  }

  int reads() const { return reads_; }
  int polls() const { return polls_; }
  std::size_t consumed() const { return pos_; }

private:
  std::string data_;
  std::size_t pos_ = 0;
  int polls_ = 0;
  int reads_ = 0;
  int exit_on_poll_ = 0;
  int fail_every_ = 0;
  bool eof_ = true;
  bool never_exit_ = false;
};

// Replays captured terminal output into a character grid, understanding
// exactly what the canvas emits: CSI n A/B/C/D, cursor show/hide, clear and
// home, CR, and LF as a tty with onlcr shows it (next line, column 0).
class TerminalReplay {
public:
  explicit TerminalReplay(const std::string& output) {
    feed(output);
  }

  std::string line(int row) const {
    if(row < 0 || row >= static_cast<int>(grid_.size())) return {};
    std::string text = grid_[static_cast<std::size_t>(row)];
    text.erase(text.find_last_not_of(' ') + 1);
    return text;
  }

  int row() const { return row_; }
  int col() const { return col_; }
  bool cursor_visible() const { return visible_; }
  bool went_negative() const { return went_negative_; }

private:
  void feed(const std::string& out) {
    std::size_t i = 0;
    while(i < out.size()) {
      char ch = out[i];
      if(ch == '\x1b' && i + 1 < out.size() && out[i + 1] == '[') {
        std::size_t j = i + 2;
        std::string params;
        while(j < out.size() && !(out[j] >= '@' && out[j] <= '~')) {
          params += out[j++];
        }
        if(j < out.size()) apply_csi(params, out[j]);
        i = j + 1;
        continue;
      }
      if(ch == '\r') {
        col_ = 0;
      } else if(ch == '\n') {
        ++row_;
        col_ = 0;
      } else {
        put(ch);
      }
      ++i;
    }
  }

  void apply_csi(const std::string& params, char final_byte) {
    if(params == "?25l") { visible_ = false; return; }
    if(params == "?25h") { visible_ = true; return; }
    int n = params.empty() ? 1 : std::atoi(params.c_str());
    switch(final_byte) {
      case 'A': row_ -= n; break;
      case 'B': row_ += n; break;
      case 'C': col_ += n; break;
      case 'D': col_ -= n; break;
      case 'H': row_ = 0; col_ = 0; break;
      case 'J': grid_.clear(); break;
      default: break;
    }
    if(row_ < 0 || col_ < 0) {
      went_negative_ = true;
      row_ = std::max(row_, 0);
      col_ = std::max(col_, 0);
    }
  }

  void put(char ch) {
    if(grid_.size() <= static_cast<std::size_t>(row_)) grid_.resize(static_cast<std::size_t>(row_) + 1);
    auto& text = grid_[static_cast<std::size_t>(row_)];
    if(text.size() <= static_cast<std::size_t>(col_)) text.resize(static_cast<std::size_t>(col_) + 1, ' ');
    text[static_cast<std::size_t>(col_)] = ch;
    ++col_;
  }

  std::vector<std::string> grid_;
  int row_ = 0;
  int col_ = 0;
  bool visible_ = true;
  bool went_negative_ = false;
};

class TempDir {
public:
  explicit TempDir(const std::string& name)
    : path_(std::filesystem::temp_directory_path() / name) {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    std::filesystem::create_directories(path_, ec);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  const std::filesystem::path& path() const { return path_; }

  void write(const std::filesystem::path& relative, const std::string& content) const {
    auto target = path_ / relative;
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    std::ofstream out(target, std::ios::trunc);
    out << content;
  }

private:
  std::filesystem::path path_;
};

inline bool wait_for_condition(std::function<bool()> predicate,
                               std::chrono::milliseconds timeout,
                               std::chrono::milliseconds interval = std::chrono::milliseconds(10)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while(std::chrono::steady_clock::now() < deadline) {
    if(predicate()) return true;
    std::this_thread::sleep_for(interval);
  }
  return predicate();
}

} // namespace lsync::test
