#pragma once
/*
 * HeadlessDisplay
 *
 * Purpose: DisplaySurface without a terminal, for automated tests.
 * Records the last frame (text/status/cursor) and replays queued input.
 * get_input() returns InputNone once the queue is exhausted.
 */
#include <deque>
#include <string>
#include <string_view>
#include "display.hpp"

class HeadlessDisplay : public DisplaySurface {
public:
  explicit HeadlessDisplay(TermSize sz = {24, 80}) : size_(sz) {}

  TermSize size() const override { return size_; }
  void clear() override { text_.clear(); status_.clear(); }
  void render_text(const std::string& text, Position cursor) override { text_ = text; cursor_ = cursor; }
  void render_status(const std::string& status) override { status_ = status; }
  void move_cursor(Position pos) override { cursor_ = pos; }
  void refresh() override { ++frames_; }
  int get_input() override {
    if (input_.empty()) return InputNone;
    int ch = input_.front();
    input_.pop_front();
    return ch;
  }

  void push_input(int code) { input_.push_back(code); }
  void push_keys(std::string_view keys) { for (char c : keys) input_.push_back(static_cast<unsigned char>(c)); }
  bool input_pending() const { return !input_.empty(); }

  const std::string& text() const { return text_; }
  const std::string& status() const { return status_; }
  Position cursor() const { return cursor_; }
  int frames() const { return frames_; }

private:
  TermSize size_;
  std::deque<int> input_;
  std::string text_;
  std::string status_;
  Position cursor_{};
  int frames_ = 0;
};
