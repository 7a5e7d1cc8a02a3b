#include "document.hpp"
#include "editor_ops.hpp"
#include <cassert>
#include <string>

static void run_clipboard_tests() {
  Document d = Document::from_content("Hello World");
  EditorOps ops(d);
  std::string out;
  assert(ops.copy_selection(0, 5, out).ok());
  assert(out == "Hello");
  assert(ops.clipboard() == "Hello");
  assert(d.content() == "Hello World");

  ops.move_to(Position{11, 0});
  assert(ops.cursor_offset() == 11);
  assert(ops.paste(ops.clipboard()).ok());
  assert(d.content() == "Hello WorldHello");
  assert(ops.cursor() == (Position{16, 0}));

  assert(ops.copy_selection(5, 5, out).kind == ErrorKind::InvalidOperation);
  assert(ops.copy_selection(0, 99, out).kind == ErrorKind::InvalidOperation);
  assert(ops.copy_selection(16, 17, out).kind == ErrorKind::InvalidOperation);
  assert(ops.clipboard() == "Hello");

  Document c = Document::from_content("Hello World");
  EditorOps cut(c);
  assert(cut.cut_selection(0, 6, out).ok());
  assert(out == "Hello ");
  assert(c.content() == "World");
  assert(cut.cursor() == (Position{0, 0}));
  assert(cut.clipboard() == "Hello ");

  Document m = Document::from_content("ab\ncd");
  EditorOps multi(m);
  assert(multi.cut_selection(1, 4, out).ok());
  assert(out == "b\nc");
  assert(m.content() == "ad");
  multi.move_to(Position{2, 0});
  assert(multi.paste("\nx").ok());
  assert(m.content() == "ad\nx");
  assert(multi.cursor() == (Position{1, 1}));
}

static void run_typing_tests() {
  Document d;
  EditorOps ops(d);
  assert(ops.insert_char('a').ok());
  assert(ops.insert_char('b').ok());
  assert(ops.insert_char('\n').ok());
  assert(ops.insert_char('c').ok());
  assert(d.content() == "ab\nc");
  assert(ops.cursor() == (Position{1, 1}));

  assert(ops.delete_char().ok());
  assert(d.content() == "ab\n");
  assert(ops.cursor() == (Position{0, 1}));
  assert(ops.delete_char().ok());
  assert(d.content() == "ab");
  assert(ops.cursor() == (Position{2, 0}));

  ops.move_to(Position{0, 0});
  assert(ops.delete_char().ok());
  assert(d.content() == "ab");

  assert(ops.delete_forward().ok());
  assert(d.content() == "b");
  assert(ops.cursor() == (Position{0, 0}));
  ops.move_to(Position{1, 0});
  assert(ops.delete_forward().ok());
  assert(d.content() == "b");
}

static void run_motion_tests() {
  Document d = Document::from_content("ab\ncde");
  EditorOps ops(d);
  ops.move_cursor(5, 0);
  assert(ops.cursor() == (Position{2, 0}));
  ops.move_cursor(0, 1);
  assert(ops.cursor() == (Position{2, 1}));
  ops.move_cursor(1, 0);
  assert(ops.cursor() == (Position{3, 1}));
  ops.move_cursor(0, 4);
  assert(ops.cursor() == (Position{3, 1}));
  ops.move_cursor(-10, -10);
  assert(ops.cursor() == (Position{0, 0}));

  assert(!ops.has_selection());
  assert(!ops.selection_range().has_value());
  ops.move_to(Position{1, 1});
  ops.start_selection();
  ops.move_to(Position{1, 0});
  auto range = ops.selection_range();
  assert(range.has_value());
  assert(range->first == 1 && range->second == 4);
  ops.clear_selection();
  assert(!ops.has_selection());

  // cursor left past the end after an external edit is pulled back in
  ops.move_to(Position{3, 1});
  d.clear();
  ops.constrain_cursor();
  assert(ops.cursor() == (Position{0, 0}));
}

int main() {
  run_clipboard_tests();
  run_typing_tests();
  run_motion_tests();
  return 0;
}
