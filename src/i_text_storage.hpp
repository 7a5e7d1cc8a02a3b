#pragma once
/*
 * ITextStorage
 *
 * Purpose: capability interface for anything that holds editable text
 * (a single Document, or a Session routing to its current Document).
 * Offsets are byte indices into content(); lines are split on '\n'.
 */
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include "types.hpp"

class TextStorage {
public:
  virtual ~TextStorage() = default;

  virtual const std::string& content() const = 0;
  virtual size_t length() const = 0;
  virtual bool empty() const = 0;

  /*mutation*/
  virtual Status insert(size_t offset, char ch) = 0;
  // Deletes the character before offset (backspace semantics).
  virtual Status erase(size_t offset) = 0;
  virtual Status append(std::string_view text) = 0;
  virtual void clear() = 0;

  /*line view*/
  virtual size_t line_count() const = 0;
  virtual size_t line_length(size_t line) const = 0;
  virtual std::optional<std::string_view> get_line(size_t line) const = 0;
};
