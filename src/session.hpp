#pragma once
/*
 * Session
 *
 * Purpose: ordered set of open Documents with per-document metadata, one of
 * them current. Text calls on the Session route to the current Document.
 * Invariants:
 *  - documents_ and meta_ are parallel (same length, same index);
 *  - never empty: closing the last document swaps in a fresh untitled one;
 *  - current_ < documents_.size().
 * Dirty tracking: every successful mutation marks the current document dirty,
 * except a recognized no-op (appending empty text); a successful save clears it.
 */
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "document.hpp"
#include "file_service.hpp"
#include "i_text_storage.hpp"

struct DocumentMetadata {
  std::string name;
  bool dirty = false;
};

class Session : public TextStorage {
public:
  explicit Session(const FileService& files);
  static Session from_files(const FileService& files, const std::vector<std::string>& names, Status& st);

  /*document management*/
  Status open_or_focus(const std::string& name, size_t& index);
  size_t new_empty();
  Status switch_to(size_t index);
  Status close(size_t index);
  Status next();
  Status previous();
  Status save_current();
  Status save_as(const std::string& name);
  void replace_current_content(std::string text);

  std::optional<size_t> find_by_name(std::string_view name) const;
  size_t buffer_count() const { return documents_.size(); }
  size_t current_index() const { return current_; }
  const Document& current() const { return documents_[current_]; }
  const DocumentMetadata& current_metadata() const { return meta_[current_]; }
  const DocumentMetadata* metadata(size_t index) const;
  std::vector<std::pair<size_t, const DocumentMetadata*>> list() const;
  size_t dirty_count() const;
  std::string status_line() const;

  /*TextStorage, routed to the current document*/
  const std::string& content() const override { return current().content(); }
  size_t length() const override { return current().length(); }
  bool empty() const override { return current().empty(); }
  Status insert(size_t offset, char ch) override;
  Status erase(size_t offset) override;
  Status append(std::string_view text) override;
  void clear() override;
  size_t line_count() const override { return current().line_count(); }
  size_t line_length(size_t line) const override { return current().line_length(line); }
  std::optional<std::string_view> get_line(size_t line) const override { return current().get_line(line); }

private:
  Session(const FileService& files, bool seed);
  std::string next_untitled_name();
  Status mark_dirty_if(Status st);

  const FileService& files_;
  std::vector<Document> documents_;
  std::vector<DocumentMetadata> meta_;
  size_t current_ = 0;
  size_t next_untitled_ = 0;
};
