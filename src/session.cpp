#include "session.hpp"
#include <algorithm>
#include "config.hpp"

Session::Session(const FileService& files) : Session(files, true) {}

Session::Session(const FileService& files, bool seed) : files_(files) {
  if (seed) new_empty();
}

Session Session::from_files(const FileService& files, const std::vector<std::string>& names, Status& st) {
  Session s(files, false);
  st = Status::success();
  for (const auto& name : names) {
    size_t idx = 0;
    st = s.open_or_focus(name, idx);
    if (!st) break;
  }
  if (s.documents_.empty()) s.new_empty();
  return s;
}

std::string Session::next_untitled_name() {
  return BUFED_UNTITLED_PREFIX + std::to_string(next_untitled_++);
}

Status Session::open_or_focus(const std::string& name, size_t& index) {
  if (auto found = find_by_name(name)) {
    current_ = *found;
    index = *found;
    return Status::success();
  }
  std::string text;
  if (Status st = files_.open(name, text); !st) return st;
  documents_.push_back(Document::from_content(std::move(text)));
  meta_.push_back(DocumentMetadata{name, false});
  current_ = documents_.size() - 1;
  index = current_;
  return Status::success();
}

size_t Session::new_empty() {
  documents_.emplace_back();
  meta_.push_back(DocumentMetadata{next_untitled_name(), false});
  current_ = documents_.size() - 1;
  return current_;
}

Status Session::switch_to(size_t index) {
  if (index >= documents_.size()) return Status::out_of_bounds("Buffer index " + std::to_string(index) + " out of range");
  current_ = index;
  return Status::success();
}

Status Session::close(size_t index) {
  if (index >= documents_.size()) return Status::out_of_bounds("Buffer index " + std::to_string(index) + " out of range");
  if (documents_.size() == 1) {
    documents_[0] = Document();
    meta_[0] = DocumentMetadata{next_untitled_name(), false};
    current_ = 0;
    return Status::success();
  }
  documents_.erase(documents_.begin() + static_cast<std::ptrdiff_t>(index));
  meta_.erase(meta_.begin() + static_cast<std::ptrdiff_t>(index));
  if (current_ >= index && current_ > 0) {
    current_--;
  } else if (current_ >= documents_.size()) {
    current_ = documents_.size() - 1;
  }
  return Status::success();
}

Status Session::next() {
  if (documents_.empty()) return Status::invalid("No buffers available");
  current_ = (current_ + 1) % documents_.size();
  return Status::success();
}

Status Session::previous() {
  if (documents_.empty()) return Status::invalid("No buffers available");
  current_ = (current_ == 0) ? documents_.size() - 1 : current_ - 1;
  return Status::success();
}

Status Session::save_current() {
  DocumentMetadata& m = meta_[current_];
  if (Status st = files_.save(m.name, documents_[current_].content()); !st) return st;
  m.dirty = false;
  return Status::success();
}

Status Session::save_as(const std::string& name) {
  DocumentMetadata& m = meta_[current_];
  std::string old = m.name;
  m.name = name;
  Status st = save_current();
  if (!st) m.name = old;
  return st;
}

void Session::replace_current_content(std::string text) {
  documents_[current_] = Document::from_content(std::move(text));
  meta_[current_].dirty = true;
}

std::optional<size_t> Session::find_by_name(std::string_view name) const {
  auto it = std::find_if(meta_.begin(), meta_.end(), [&](const DocumentMetadata& m) { return m.name == name; });
  if (it == meta_.end()) return std::nullopt;
  return static_cast<size_t>(it - meta_.begin());
}

const DocumentMetadata* Session::metadata(size_t index) const {
  if (index >= meta_.size()) return nullptr;
  return &meta_[index];
}

std::vector<std::pair<size_t, const DocumentMetadata*>> Session::list() const {
  std::vector<std::pair<size_t, const DocumentMetadata*>> out;
  out.reserve(meta_.size());
  for (size_t i = 0; i < meta_.size(); ++i) out.emplace_back(i, &meta_[i]);
  return out;
}

size_t Session::dirty_count() const {
  return static_cast<size_t>(std::count_if(meta_.begin(), meta_.end(), [](const DocumentMetadata& m) { return m.dirty; }));
}

std::string Session::status_line() const {
  const DocumentMetadata& m = meta_[current_];
  std::string s = m.name;
  if (m.dirty) s += "*";
  if (documents_.size() > 1) {
    s += " [" + std::to_string(current_ + 1) + "/" + std::to_string(documents_.size()) + "]";
  }
  return s;
}

Status Session::mark_dirty_if(Status st) {
  if (st) meta_[current_].dirty = true;
  return st;
}

Status Session::insert(size_t offset, char ch) { return mark_dirty_if(documents_[current_].insert(offset, ch)); }

Status Session::erase(size_t offset) { return mark_dirty_if(documents_[current_].erase(offset)); }

Status Session::append(std::string_view text) {
  if (text.empty()) return Status::success();
  return mark_dirty_if(documents_[current_].append(text));
}

void Session::clear() {
  documents_[current_].clear();
  meta_[current_].dirty = true;
}
