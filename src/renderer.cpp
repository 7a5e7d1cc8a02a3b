#include "renderer.hpp"
#include <algorithm>

std::string StatusLine::format() const {
  const char* mode_str = (mode == Mode::Edit) ? "EDIT" : "COMMAND";
  return "File: " + filename + (modified ? "*" : "") +
         " | Position: " + std::to_string(position.line + 1) + ":" + std::to_string(position.column + 1) +
         " | Mode: " + mode_str;
}

void Renderer::render(DisplaySurface& out, const TextStorage& buf, Position cur, Viewport& vp, const std::string& status) {
  TermSize sz = out.size();
  size_t max_text_rows = static_cast<size_t>(std::max(1, sz.rows - 1));
  size_t text_cols = static_cast<size_t>(std::max(1, sz.cols));
  if (cur.line < vp.top_line) vp.top_line = cur.line;
  if (cur.line >= vp.top_line + max_text_rows) vp.top_line = cur.line - max_text_rows + 1;
  if (cur.column < vp.left_col) vp.left_col = cur.column;
  else if (cur.column >= vp.left_col + text_cols) vp.left_col = cur.column - text_cols + 1;

  std::string frame;
  size_t n = buf.line_count();
  for (size_t i = 0; i < max_text_rows; ++i) {
    size_t line_idx = vp.top_line + i;
    if (line_idx >= n) break;
    auto s = buf.get_line(line_idx);
    if (i > 0) frame.push_back('\n');
    if (!s || s->size() <= vp.left_col) continue;
    frame.append(s->substr(vp.left_col, text_cols));
  }
  Position rel{cur.column - vp.left_col, cur.line - vp.top_line};
  out.clear();
  out.render_text(frame, rel);
  out.render_status(status);
  out.move_cursor(rel);
  out.refresh();
}

void Renderer::render_page(DisplaySurface& out, const std::string& text, const std::string& status) {
  out.clear();
  out.render_text(text, Position{});
  out.render_status(status);
  out.move_cursor(Position{});
  out.refresh();
}
