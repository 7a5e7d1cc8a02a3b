#pragma once
/*
 * Document
 *
 * Purpose: in-memory text container; canonical text plus its split into lines.
 * Invariant: join(lines, "\n") == content after every public call returns.
 * Note: structural edits work on lines and rebuild the text; append is the
 * one path that rebuilds lines from the text.
 */
#include <string>
#include <string_view>
#include <vector>
#include "i_text_storage.hpp"

class Document : public TextStorage {
public:
  Document();
  static Document from_content(std::string content);

  const std::string& content() const override { return content_; }
  size_t length() const override { return content_.size(); }
  bool empty() const override { return content_.empty(); }

  Status insert(size_t offset, char ch) override;
  Status erase(size_t offset) override;
  Status append(std::string_view text) override;
  void clear() override;

  size_t line_count() const override { return lines_.size(); }
  size_t line_length(size_t line) const override;
  std::optional<std::string_view> get_line(size_t line) const override;
  const std::vector<std::string>& lines() const { return lines_; }

  // Strict translation; OutOfBounds instead of clamping.
  Status position_of(size_t offset, Position& out) const;
  Status offset_of(Position pos, size_t& out) const;

private:
  void rebuild_content();
  void rebuild_lines();

  std::string content_;
  std::vector<std::string> lines_;
};

std::vector<std::string> split_lines(std::string_view text);
