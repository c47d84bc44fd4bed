#pragma once
/*
 * UISession
 *
 * RAII scope around one UICanvas: hides the cursor on entry, and on every
 * exit path shows it again and ends the output with a newline so the shell
 * prompt starts on a fresh line. A session is closed exactly once and cannot
 * be reopened.
 */
#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include "cursor_tool.hpp"
#include "log.hpp"
#include "ui_canvas.hpp"

class UISession {
public:
  enum class State { Idle, Active, Closed };

  static constexpr const char* kDefaultDescription = "TinyUI";

  UISession(std::ostream& out,
            int line_count,
            const std::string& description = kDefaultDescription,
            std::shared_ptr<Logger> logger = nullptr);
  ~UISession();

  UISession(const UISession&) = delete;
  UISession& operator=(const UISession&) = delete;

  UICanvas& canvas();
  State state() const { return state_; }

  // Restores the terminal. Safe to call more than once; only the first call
  // writes anything.
  void close() noexcept;

private:
  void restore_terminal() noexcept;

  std::ostream& out_;
  CursorTool cursor_;
  std::shared_ptr<Logger> logger_;
  std::optional<ScopedLogSilence> silence_;
  std::unique_ptr<UICanvas> canvas_;
  State state_ = State::Idle;
};

// Runs body(canvas) inside a session. Exceptions from body propagate after
// the terminal has been restored.
template<typename Body>
void run_ui_session(std::ostream& out,
                    int line_count,
                    const std::string& description,
                    Body&& body) {
  UISession session(out, line_count, description);
  body(session.canvas());
}
