#include "document.hpp"
#include "headless_display.hpp"
#include "renderer.hpp"
#include <cassert>
#include <string>

static void run_status_line_tests() {
  StatusLine sl;
  assert(sl.format() == "File: untitled | Position: 1:1 | Mode: EDIT");
  sl.filename = "a.txt";
  sl.position = Position{2, 0};
  sl.modified = true;
  assert(sl.format() == "File: a.txt* | Position: 1:3 | Mode: EDIT");
  sl.mode = Mode::Command;
  sl.modified = false;
  sl.position = Position{0, 9};
  assert(sl.format() == "File: a.txt | Position: 10:1 | Mode: COMMAND");
}

static void run_scroll_tests() {
  std::string text;
  for (int i = 0; i < 10; ++i) {
    if (i > 0) text.push_back('\n');
    text += "line" + std::to_string(i);
  }
  Document d = Document::from_content(text);
  HeadlessDisplay out({5, 10});
  Renderer r;
  Viewport vp;

  r.render(out, d, Position{0, 0}, vp, "status");
  assert(vp.top_line == 0);
  assert(out.text() == "line0\nline1\nline2\nline3");
  assert(out.status() == "status");
  assert(out.cursor() == (Position{0, 0}));
  assert(out.frames() == 1);

  r.render(out, d, Position{2, 7}, vp, "status");
  assert(vp.top_line == 4);
  assert(out.text() == "line4\nline5\nline6\nline7");
  assert(out.cursor() == (Position{2, 3}));

  r.render(out, d, Position{0, 5}, vp, "status");
  assert(vp.top_line == 4);
  assert(out.cursor() == (Position{0, 1}));

  r.render(out, d, Position{0, 1}, vp, "status");
  assert(vp.top_line == 1);
  assert(out.text() == "line1\nline2\nline3\nline4");
}

static void run_horizontal_tests() {
  Document d = Document::from_content("abcdefghijklmnop\nxy");
  HeadlessDisplay out({3, 10});
  Renderer r;
  Viewport vp;
  r.render(out, d, Position{12, 0}, vp, "");
  assert(vp.left_col == 3);
  assert(out.text() == "defghijklm\n");
  assert(out.cursor() == (Position{9, 0}));

  r.render(out, d, Position{1, 1}, vp, "");
  assert(vp.left_col == 1);
  assert(out.text() == "bcdefghijk\ny");
}

static void run_page_tests() {
  HeadlessDisplay out;
  Renderer r;
  r.render_page(out, "help text", "Press any key to continue");
  assert(out.text() == "help text");
  assert(out.status() == "Press any key to continue");
  assert(out.cursor() == (Position{0, 0}));
}

int main() {
  run_status_line_tests();
  run_scroll_tests();
  run_horizontal_tests();
  run_page_tests();
  return 0;
}
