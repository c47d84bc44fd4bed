#pragma once
/*
 * UICanvas
 *
 * A block of line_count display lines plus a footer line directly below
 * them, updated in place with relative cursor moves only. The canvas keeps
 * its own belief of where the terminal cursor is; every public call leaves
 * that belief equal to the real cursor position.
 *
 * Not thread-safe. One thread owns a canvas for its whole lifetime.
 */
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "cursor_tool.hpp"

// Caller broke a canvas precondition (bad line index, embedded newline,
// use outside an active session).
class UsageError : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

class UICanvas {
public:
  UICanvas(std::ostream& out, int line_count);

  UICanvas(const UICanvas&) = delete;
  UICanvas& operator=(const UICanvas&) = delete;

  void move_to(std::optional<int> line, std::optional<int> column = std::nullopt);
  void write_char(char ch);
  void write_text(std::string_view text);

  // Appends ch to the given line. '\n' and '\r' restart the line at column 0
  // without printing anything.
  void update_char(int line, char ch);
  // Overwrites the line from column 0. The footer (line_count) is allowed.
  void update_line(int line, std::string_view content);
  void print_description(std::string_view text);

  int line_count() const { return line_count_; }
  int footer_line() const { return line_count_; }
  int cursor_line() const { return cursor_line_; }
  int cursor_column() const { return cursor_column_; }
  int line_column(int line) const;

private:
  void reset_pos();
  void check_content_line(int line) const;
  static void check_no_newline(std::string_view text);

  CursorTool cursor_;
  int line_count_;
  int cursor_line_ = 0;
  int cursor_column_ = 0;
  std::vector<int> line_pos_;
};
