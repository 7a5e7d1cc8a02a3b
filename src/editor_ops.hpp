#pragma once
/*
 * EditorOps
 *
 * Purpose: live-cursor editing over a TextStorage: typed input, backspace,
 * cursor motion, selection anchor, and the single clipboard slot.
 * Note: every cursor-affecting call finishes with constrain().
 */
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include "i_text_storage.hpp"
#include "types.hpp"

class EditorOps {
public:
  explicit EditorOps(TextStorage& buf) : buf_(buf) {}

  TextStorage& buffer() { return buf_; }
  const TextStorage& buffer() const { return buf_; }
  Position cursor() const { return cursor_; }
  size_t cursor_offset() const;
  const std::string& clipboard() const { return clipboard_; }

  /*typed input*/
  Status insert_char(char ch);
  Status delete_char();
  Status delete_forward();

  /*motion*/
  void move_cursor(long dx, long dy);
  void move_to(Position pos);
  void constrain_cursor();

  /*selection*/
  void start_selection();
  void clear_selection() { selection_start_.reset(); }
  bool has_selection() const { return selection_start_.has_value(); }
  std::optional<std::pair<size_t, size_t>> selection_range() const;

  /*clipboard*/
  Status copy_selection(size_t start, size_t end, std::string& out);
  Status cut_selection(size_t start, size_t end, std::string& out);
  Status paste(std::string_view text);

private:
  void advance_over(char ch);

  TextStorage& buf_;
  Position cursor_{};
  std::string clipboard_;
  std::optional<size_t> selection_start_;
};
