#include "ui_session.hpp"

UISession::UISession(std::ostream& out,
                     int line_count,
                     const std::string& description,
                     std::shared_ptr<Logger> logger)
  : out_(out),
    cursor_(out),
    logger_(std::move(logger)) {
  state_ = State::Active;
  silence_.emplace();
  try {
    cursor_.hide_cursor();
    canvas_ = std::make_unique<UICanvas>(out_, line_count);
    canvas_->print_description(description);
  } catch(...) {
    // The destructor does not run for a half-built object.
    close();
    throw;
  }
}

UISession::~UISession() {
  close();
}

UICanvas& UISession::canvas() {
  if(state_ != State::Active || !canvas_) {
    throw UsageError("canvas used outside an active session");
  }
  return *canvas_;
}

void UISession::close() noexcept {
  if(state_ != State::Active) return;
  state_ = State::Closed;
  restore_terminal();
  canvas_.reset();
  silence_.reset();
}

void UISession::restore_terminal() noexcept {
  // A failed write earlier must not stop the cursor from coming back.
  if(!out_.good()) {
    out_.clear();
  }
  try {
    cursor_.show_cursor();
    out_ << '\n';
    out_.flush();
  } catch(const std::exception& e) {
    silence_.reset();
    log_warn(logger_.get(), "terminal restore failed: {}", e.what());
    return;
  }
  if(!out_.good()) {
    out_.clear();
    silence_.reset();
    log_warn(logger_.get(), "terminal restore failed: output stream error");
  }
}
