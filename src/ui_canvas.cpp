#include "ui_canvas.hpp"

#include <spdlog/fmt/fmt.h>

namespace {

bool is_line_break(char ch) {
  return ch == '\n' || ch == '\r';
}

} // namespace

UICanvas::UICanvas(std::ostream& out, int line_count)
  : cursor_(out),
    line_count_(line_count) {
  if(line_count_ <= 0) {
    throw UsageError(fmt::format("canvas needs at least one line, got {}", line_count_));
  }
  line_pos_.assign(static_cast<std::size_t>(line_count_), 0);

  // Scroll enough room below the current line so later downward moves never
  // hit the bottom edge of the screen, then come back up to line 0.
  out << std::string(static_cast<std::size_t>(line_count_), '\n');
  cursor_.move_up(line_count_);
  reset_pos();
}

void UICanvas::reset_pos() {
  move_to(line_count_, 0);
}

void UICanvas::check_content_line(int line) const {
  if(line < 0 || line >= line_count_) {
    throw UsageError(fmt::format("line {} outside canvas [0, {})", line, line_count_));
  }
}

void UICanvas::check_no_newline(std::string_view text) {
  if(text.find_first_of("\r\n") != std::string_view::npos) {
    throw UsageError("canvas text must not contain '\\n' or '\\r'");
  }
}

int UICanvas::line_column(int line) const {
  check_content_line(line);
  return line_pos_[static_cast<std::size_t>(line)];
}

void UICanvas::move_to(std::optional<int> line, std::optional<int> column) {
  if(line) {
    if(*line < 0 || *line > line_count_) {
      throw UsageError(fmt::format("line {} outside canvas [0, {}]", *line, line_count_));
    }
    cursor_.move_vertical(*line - cursor_line_);
    cursor_line_ = *line;
  }
  if(column) {
    if(*column < 0) {
      throw UsageError(fmt::format("negative column {}", *column));
    }
    cursor_.move_horizontal(*column - cursor_column_);
    cursor_column_ = *column;
  }
}

void UICanvas::write_char(char ch) {
  auto& out = cursor_.stream();
  out.put(ch);
  out.flush();
  cursor_column_ += 1;
}

void UICanvas::write_text(std::string_view text) {
  check_no_newline(text);
  auto& out = cursor_.stream();
  out.write(text.data(), static_cast<std::streamsize>(text.size()));
  out.flush();
  cursor_column_ += static_cast<int>(text.size());
}

void UICanvas::update_char(int line, char ch) {
  check_content_line(line);
  auto& pos = line_pos_[static_cast<std::size_t>(line)];

  if(is_line_break(ch)) {
    pos = 0;
  } else {
    move_to(line, pos);
    write_char(ch);
    pos = cursor_column_;
  }

  reset_pos();
}

void UICanvas::update_line(int line, std::string_view content) {
  if(line < 0 || line > line_count_) {
    throw UsageError(fmt::format("line {} outside canvas [0, {}]", line, line_count_));
  }
  check_no_newline(content);

  move_to(line, 0);
  write_text(content);
  reset_pos();
}

void UICanvas::print_description(std::string_view text) {
  update_line(line_count_, fmt::format("===== {} =====", text));
}
