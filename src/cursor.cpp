#include "cursor.hpp"
#include <algorithm>

size_t to_offset(const TextStorage& doc, Position pos) {
  size_t n = doc.line_count();
  if (n == 0) return 0;
  size_t line = std::min(pos.line, n - 1);
  size_t offset = 0;
  for (size_t i = 0; i < line; ++i) offset += doc.line_length(i) + 1;
  return offset + std::min(pos.column, doc.line_length(line));
}

Position from_offset(const TextStorage& doc, size_t offset) {
  size_t acc = 0;
  size_t n = doc.line_count();
  for (size_t i = 0; i < n; ++i) {
    size_t len = doc.line_length(i);
    if (acc + len >= offset) return Position{offset - acc, i};
    acc += len + 1;
  }
  if (n == 0) return Position{};
  return Position{doc.line_length(n - 1), n - 1};
}

Position constrain(const TextStorage& doc, Position pos) {
  size_t n = doc.line_count();
  if (n == 0) return Position{};
  if (pos.line >= n) pos.line = n - 1;
  size_t len = doc.line_length(pos.line);
  if (pos.column > len) pos.column = len;
  return pos;
}
