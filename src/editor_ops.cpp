#include "editor_ops.hpp"
#include "cursor.hpp"

size_t EditorOps::cursor_offset() const { return to_offset(buf_, cursor_); }

void EditorOps::advance_over(char ch) {
  if (ch == '\n') { cursor_.line++; cursor_.column = 0; }
  else cursor_.column++;
}

void EditorOps::constrain_cursor() { cursor_ = constrain(buf_, cursor_); }

Status EditorOps::insert_char(char ch) {
  if (Status st = buf_.insert(cursor_offset(), ch); !st) return st;
  advance_over(ch);
  constrain_cursor();
  return Status::success();
}

// Backspace: removes the character before the cursor; nothing to do at the
// very start of the buffer.
Status EditorOps::delete_char() {
  size_t offset = cursor_offset();
  if (offset == 0) return Status::success();
  if (Status st = buf_.erase(offset); !st) return st;
  cursor_ = from_offset(buf_, offset - 1);
  constrain_cursor();
  return Status::success();
}

Status EditorOps::delete_forward() {
  size_t offset = cursor_offset();
  if (offset >= buf_.length()) return Status::success();
  if (Status st = buf_.erase(offset + 1); !st) return st;
  cursor_ = from_offset(buf_, offset);
  constrain_cursor();
  return Status::success();
}

void EditorOps::move_cursor(long dx, long dy) {
  long c = static_cast<long>(cursor_.column) + dx;
  long l = static_cast<long>(cursor_.line) + dy;
  cursor_.column = c < 0 ? 0 : static_cast<size_t>(c);
  cursor_.line = l < 0 ? 0 : static_cast<size_t>(l);
  constrain_cursor();
}

void EditorOps::move_to(Position pos) {
  cursor_ = pos;
  constrain_cursor();
}

void EditorOps::start_selection() { selection_start_ = cursor_offset(); }

std::optional<std::pair<size_t, size_t>> EditorOps::selection_range() const {
  if (!selection_start_) return std::nullopt;
  size_t a = *selection_start_;
  size_t b = cursor_offset();
  if (a <= b) return std::make_pair(a, b);
  return std::make_pair(b, a);
}

Status EditorOps::copy_selection(size_t start, size_t end, std::string& out) {
  size_t len = buf_.length();
  if (start >= len || end > len || start >= end) return Status::invalid("Invalid selection range");
  out = buf_.content().substr(start, end - start);
  clipboard_ = out;
  return Status::success();
}

// The range is removed with the delete-before primitive at a fixed offset:
// each call drops the character at `start` and shifts the rest left.
Status EditorOps::cut_selection(size_t start, size_t end, std::string& out) {
  if (Status st = copy_selection(start, end, out); !st) return st;
  for (size_t i = start; i < end; ++i) {
    if (Status st = buf_.erase(start + 1); !st) return st;
  }
  cursor_ = from_offset(buf_, start);
  constrain_cursor();
  return Status::success();
}

Status EditorOps::paste(std::string_view text) {
  for (char ch : text) {
    if (Status st = buf_.insert(cursor_offset(), ch); !st) return st;
    advance_over(ch);
  }
  constrain_cursor();
  return Status::success();
}
