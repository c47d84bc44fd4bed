#include "cursor_tool.hpp"

void CursorTool::emit_csi(int n, char final_byte) {
  out_ << "\x1b[" << n << final_byte;
  out_.flush();
}

void CursorTool::move_up(int n) { emit_csi(n, 'A'); }
void CursorTool::move_down(int n) { emit_csi(n, 'B'); }
void CursorTool::move_right(int n) { emit_csi(n, 'C'); }
void CursorTool::move_left(int n) { emit_csi(n, 'D'); }

void CursorTool::move_vertical(int delta) {
  if(delta > 0) {
    move_down(delta);
  } else if(delta < 0) {
    move_up(-delta);
  }
}

void CursorTool::move_horizontal(int delta) {
  if(delta > 0) {
    move_right(delta);
  } else if(delta < 0) {
    move_left(-delta);
  }
}

void CursorTool::reset_line() {
  out_ << '\r';
  out_.flush();
}

void CursorTool::hide_cursor() {
  out_ << "\x1b[?25l";
  out_.flush();
}

void CursorTool::show_cursor() {
  out_ << "\x1b[?25h";
  out_.flush();
}

void CursorTool::clear_screen() {
  out_ << "\x1b[2J\x1b[H";
  out_.flush();
}
