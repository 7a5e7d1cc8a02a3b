#include "document.hpp"
#include <utility>

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> lines;
  size_t st = 0;
  while (st <= text.size()) {
    size_t pos = text.find('\n', st);
    if (pos == std::string_view::npos) { lines.emplace_back(text.substr(st)); break; }
    lines.emplace_back(text.substr(st, pos - st));
    st = pos + 1;
  }
  if (lines.empty()) lines.emplace_back("");
  return lines;
}

Document::Document() : lines_(1) {}

Document Document::from_content(std::string content) {
  Document d;
  d.content_ = std::move(content);
  d.rebuild_lines();
  return d;
}

void Document::rebuild_content() {
  content_.clear();
  for (size_t i = 0; i < lines_.size(); ++i) {
    if (i > 0) content_.push_back('\n');
    content_ += lines_[i];
  }
}

void Document::rebuild_lines() { lines_ = split_lines(content_); }

size_t Document::line_length(size_t line) const {
  if (line >= lines_.size()) return 0;
  return lines_[line].size();
}

std::optional<std::string_view> Document::get_line(size_t line) const {
  if (line >= lines_.size()) return std::nullopt;
  return std::string_view(lines_[line]);
}

Status Document::position_of(size_t offset, Position& out) const {
  size_t acc = 0;
  for (size_t i = 0; i < lines_.size(); ++i) {
    if (acc + lines_[i].size() >= offset) {
      out = Position{offset - acc, i};
      return Status::success();
    }
    acc += lines_[i].size() + 1;
  }
  return Status::out_of_bounds("offset " + std::to_string(offset) + " beyond end of text");
}

Status Document::offset_of(Position pos, size_t& out) const {
  if (pos.line >= lines_.size()) return Status::out_of_bounds("line " + std::to_string(pos.line) + " out of range");
  if (pos.column > lines_[pos.line].size()) return Status::out_of_bounds("column " + std::to_string(pos.column) + " out of range");
  size_t acc = 0;
  for (size_t i = 0; i < pos.line; ++i) acc += lines_[i].size() + 1;
  out = acc + pos.column;
  return Status::success();
}

Status Document::insert(size_t offset, char ch) {
  if (offset > content_.size()) return Status::out_of_bounds("insert offset " + std::to_string(offset) + " out of range");
  Position p;
  if (Status st = position_of(offset, p); !st) return st;
  std::string& s = lines_[p.line];
  if (ch == '\n') {
    std::string right = s.substr(p.column);
    s.erase(p.column);
    lines_.insert(lines_.begin() + static_cast<std::ptrdiff_t>(p.line + 1), std::move(right));
  } else {
    s.insert(s.begin() + static_cast<std::ptrdiff_t>(p.column), ch);
  }
  rebuild_content();
  return Status::success();
}

Status Document::erase(size_t offset) {
  if (offset > content_.size()) return Status::out_of_bounds("delete offset " + std::to_string(offset) + " out of range");
  Position p;
  if (Status st = position_of(offset, p); !st) return st;
  if (p.column == 0 && p.line > 0) {
    // merge with previous line
    std::string cur = std::move(lines_[p.line]);
    lines_.erase(lines_.begin() + static_cast<std::ptrdiff_t>(p.line));
    lines_[p.line - 1] += cur;
  } else if (p.column > 0) {
    std::string& s = lines_[p.line];
    s.erase(s.begin() + static_cast<std::ptrdiff_t>(p.column - 1));
  } else {
    return Status::invalid("cannot delete at beginning of buffer");
  }
  rebuild_content();
  return Status::success();
}

Status Document::append(std::string_view text) {
  if (text.empty()) return Status::success();
  content_.append(text);
  rebuild_lines();
  return Status::success();
}

void Document::clear() {
  content_.clear();
  lines_.assign(1, std::string());
}
