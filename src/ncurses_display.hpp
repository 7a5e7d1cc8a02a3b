#pragma once
/*
 * NcursesDisplay
 *
 * Purpose: DisplaySurface implementation on ncurses.
 * Lifetime: RAII; the constructor initializes the terminal (raw/noecho/keypad),
 * the destructor restores it. Construct at most one at a time.
 * Layout: all rows but the last hold text, the last row is the status bar.
 */
#include "display.hpp"

class NcursesDisplay : public DisplaySurface {
public:
  NcursesDisplay();
  ~NcursesDisplay() override;
  NcursesDisplay(const NcursesDisplay&) = delete;
  NcursesDisplay& operator=(const NcursesDisplay&) = delete;

  TermSize size() const override;
  void clear() override;
  void render_text(const std::string& text, Position cursor) override;
  void render_status(const std::string& status) override;
  void move_cursor(Position pos) override;
  void refresh() override;
  int get_input() override;

private:
  Position cursor_{};
};
