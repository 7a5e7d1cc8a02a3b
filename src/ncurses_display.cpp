#include "ncurses_display.hpp"
#include <ncurses.h>
#include <locale.h>
#include <algorithm>

// ncurses pseudo-functions that collide with DisplaySurface members
#undef clear
#undef erase
#undef move
#undef refresh

static constexpr short STATUS_PAIR = 1;
static constexpr short TEXT_PAIR = 2;

NcursesDisplay::NcursesDisplay() {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  ESCDELAY = 25;
  if (has_colors()) {
    start_color();
    if (use_default_colors() == OK) {
      init_pair(STATUS_PAIR, COLOR_BLACK, COLOR_WHITE);
      init_pair(TEXT_PAIR, -1, -1);
    } else {
      init_pair(STATUS_PAIR, COLOR_BLACK, COLOR_WHITE); // fallback
      init_pair(TEXT_PAIR, COLOR_WHITE, COLOR_BLACK);
    }
  }
}

NcursesDisplay::~NcursesDisplay() { endwin(); }

TermSize NcursesDisplay::size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesDisplay::clear() { werase(stdscr); }

void NcursesDisplay::render_text(const std::string& text, Position cursor) {
  TermSize sz = size();
  int text_rows = std::max(0, sz.rows - 1);
  int row = 0;
  size_t st = 0;
  if (has_colors()) attron(COLOR_PAIR(TEXT_PAIR));
  while (row < text_rows && st <= text.size()) {
    size_t pos = text.find('\n', st);
    size_t end = (pos == std::string::npos) ? text.size() : pos;
    int n = std::min(static_cast<int>(end - st), sz.cols);
    wmove(stdscr, row, 0);
    clrtoeol();
    if (n > 0) mvaddnstr(row, 0, text.c_str() + st, n);
    row++;
    if (pos == std::string::npos) break;
    st = pos + 1;
  }
  if (has_colors()) attroff(COLOR_PAIR(TEXT_PAIR));
  cursor_ = cursor;
}

void NcursesDisplay::render_status(const std::string& status) {
  TermSize sz = size();
  if (sz.rows <= 0) return;
  int row = sz.rows - 1;
  wmove(stdscr, row, 0);
  clrtoeol();
  if (has_colors()) attron(COLOR_PAIR(STATUS_PAIR));
  else attron(A_REVERSE);
  std::string line = status.substr(0, static_cast<size_t>(std::max(0, sz.cols)));
  line.resize(static_cast<size_t>(std::max(0, sz.cols - 1)), ' ');
  mvaddnstr(row, 0, line.c_str(), static_cast<int>(line.size()));
  if (has_colors()) attroff(COLOR_PAIR(STATUS_PAIR));
  else attroff(A_REVERSE);
}

void NcursesDisplay::move_cursor(Position pos) {
  cursor_ = pos;
  wmove(stdscr, static_cast<int>(pos.line), static_cast<int>(pos.column));
}

void NcursesDisplay::refresh() {
  wmove(stdscr, static_cast<int>(cursor_.line), static_cast<int>(cursor_.column));
  wrefresh(stdscr);
}

int NcursesDisplay::get_input() {
  int ch = getch();
  switch (ch) {
    case KEY_UP: return InputUp;
    case KEY_DOWN: return InputDown;
    case KEY_LEFT: return InputLeft;
    case KEY_RIGHT: return InputRight;
    case KEY_BACKSPACE: return InputBackspace;
    case KEY_DC: return InputDelete;
    case KEY_HOME: return InputHome;
    case KEY_END: return InputEnd;
    case KEY_ENTER: return InputEnter;
    case ERR: return InputNone;
    default: break;
  }
  if (ch >= 0 && ch < 256) return ch;
  return InputNone;
}
