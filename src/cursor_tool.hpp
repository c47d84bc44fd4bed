#pragma once
/*
 * CursorTool
 *
 * Emits relative cursor movement and visibility escape sequences.
 * Keeps no position state; UICanvas tracks where the cursor is.
 */
#include <ostream>

class CursorTool {
public:
  explicit CursorTool(std::ostream& out) : out_(out) {}

  void move_up(int n);
  void move_down(int n);
  void move_right(int n);
  void move_left(int n);

  // Positive delta moves down, negative moves up, zero writes nothing.
  void move_vertical(int delta);
  // Positive delta moves right, negative moves left, zero writes nothing.
  void move_horizontal(int delta);

  void reset_line();
  void hide_cursor();
  void show_cursor();
  void clear_screen();

  std::ostream& stream() { return out_; }

private:
  void emit_csi(int n, char final_byte);

  std::ostream& out_;
};
