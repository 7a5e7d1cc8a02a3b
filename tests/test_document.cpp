#include "document.hpp"
#include <cassert>
#include <string>
#include <vector>

static std::string join(const std::vector<std::string>& lines) {
  std::string out;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) out.push_back('\n');
    out += lines[i];
  }
  return out;
}

static void run_insert_tests() {
  Document d;
  assert(d.empty());
  assert(d.line_count() == 1);
  assert(d.insert(0, 'H').ok());
  assert(d.insert(1, 'i').ok());
  assert(d.insert(1, '\n').ok());
  assert(d.content() == "H\ni");
  assert(d.line_count() == 2);
  assert(d.lines()[0] == "H");
  assert(d.lines()[1] == "i");

  Status st = d.insert(4, 'x');
  assert(st.kind == ErrorKind::OutOfBounds);
  assert(d.content() == "H\ni");

  assert(d.insert(3, '!').ok());
  assert(d.content() == "H\ni!");
  assert(d.insert(0, '\n').ok());
  assert(d.content() == "\nH\ni!");
  assert(d.line_count() == 3);
  assert(*d.get_line(0) == "");
}

static void run_erase_tests() {
  Document a = Document::from_content("Hello");
  assert(a.erase(5).ok());
  assert(a.content() == "Hell");

  Document b = Document::from_content("Hello");
  assert(b.erase(4).ok());
  assert(b.content() == "Helo");

  assert(b.erase(0).kind == ErrorKind::InvalidOperation);
  assert(b.erase(9).kind == ErrorKind::OutOfBounds);
  assert(b.content() == "Helo");

  Document c = Document::from_content("a\nb");
  assert(c.erase(2).ok());
  assert(c.content() == "ab");
  assert(c.line_count() == 1);

  Document e = Document::from_content("x\n");
  assert(e.line_count() == 2);
  assert(e.erase(2).ok());
  assert(e.content() == "x");
}

static void run_content_tests() {
  Document d = Document::from_content("a\n");
  assert(d.line_count() == 2);
  assert(d.lines()[1].empty());
  assert(join(d.lines()) == d.content());

  Document empty = Document::from_content("");
  assert(empty.line_count() == 1);
  assert(empty.length() == 0);

  Document r = Document::from_content("one\r\ntwo");
  assert(r.lines()[0] == "one\r");
  assert(r.line_length(0) == 4);

  Document ap = Document::from_content("ab");
  assert(ap.append("x\ny").ok());
  assert(ap.content() == "abx\ny");
  assert(ap.line_count() == 2);
  assert(ap.append("").ok());
  assert(ap.content() == "abx\ny");
  ap.clear();
  assert(ap.content().empty());
  assert(ap.line_count() == 1);

  assert(!ap.get_line(9).has_value());
  assert(ap.line_length(9) == 0);

  std::vector<std::string> parts = split_lines("x\n\ny");
  assert(parts.size() == 3);
  assert(parts[1].empty());
}

static void run_translation_tests() {
  Document d = Document::from_content("ab\ncd");
  Position p;
  assert(d.position_of(3, p).ok());
  assert(p == (Position{0, 1}));
  assert(d.position_of(2, p).ok());
  assert(p == (Position{2, 0}));
  assert(d.position_of(6, p).kind == ErrorKind::OutOfBounds);

  size_t off = 0;
  assert(d.offset_of(Position{1, 1}, off).ok());
  assert(off == 4);
  assert(d.offset_of(Position{0, 5}, off).kind == ErrorKind::OutOfBounds);
  assert(d.offset_of(Position{3, 0}, off).kind == ErrorKind::OutOfBounds);
}

static void run_round_trip_tests() {
  Document d;
  const std::string typed = "line one\nline two\n\nend";
  for (size_t i = 0; i < typed.size(); ++i) {
    assert(d.insert(i, typed[i]).ok());
    assert(join(d.lines()) == d.content());
  }
  assert(d.content() == typed);
  // remove every third character from the back
  for (size_t off = d.length(); off > 0; off = off > 3 ? off - 3 : 0) {
    assert(d.erase(off).ok());
    assert(join(d.lines()) == d.content());
  }
}

int main() {
  run_insert_tests();
  run_erase_tests();
  run_content_tests();
  run_translation_tests();
  run_round_trip_tests();
  return 0;
}
