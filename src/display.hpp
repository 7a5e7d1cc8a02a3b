#pragma once
/*
 * DisplaySurface
 *
 * Purpose: abstract display backend (size, draw text/status, cursor, input).
 * Goal: decouple the editor from concrete impls (ncurses/headless), enable testing.
 * Input: get_input() returns a printable ordinal or an InputCode.
 */
#include <string>
#include "types.hpp"

struct TermSize { int rows; int cols; };

class DisplaySurface {
public:
  virtual ~DisplaySurface() = default;
  virtual TermSize size() const = 0;
  virtual void clear() = 0;
  // Draws text from the top-left of the text area; cursor is relative to it.
  virtual void render_text(const std::string& text, Position cursor) = 0;
  virtual void render_status(const std::string& status) = 0;
  virtual void move_cursor(Position pos) = 0;
  virtual void refresh() = 0;
  virtual int get_input() = 0;
};
