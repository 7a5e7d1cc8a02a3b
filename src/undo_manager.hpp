#pragma once
/*
 * Undo history
 *
 * HistoryStack<T>: bounded undo/redo pair of full snapshots. Saving a new
 * state drops the redo side; both sides evict oldest-first past capacity.
 * undo() hands back the state now on top (the one before the undone state),
 * redo() hands back the re-applied state itself.
 *
 * ActionLog: same stack over structured edit actions, with grouping.
 * TimedHistory<T>: snapshots that expire after a maximum age.
 */
#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "config.hpp"

template <typename T>
class HistoryStack {
public:
  HistoryStack() : HistoryStack(BUFED_MAX_HISTORY) {}
  explicit HistoryStack(size_t capacity) : capacity_(capacity) {}

  void save_state(T state) {
    undo_.push_back(std::move(state));
    redo_.clear();
    enforce_capacity();
  }

  std::optional<T> undo() {
    if (undo_.empty()) return std::nullopt;
    redo_.push_back(std::move(undo_.back()));
    undo_.pop_back();
    enforce_capacity();
    if (undo_.empty()) return std::nullopt;
    return undo_.back();
  }

  // Like undo(), but hands back the entry that moved to the redo side.
  std::optional<T> pop_undo() {
    if (undo_.empty()) return std::nullopt;
    T state = std::move(undo_.back());
    undo_.pop_back();
    redo_.push_back(state);
    enforce_capacity();
    return state;
  }

  std::optional<T> redo() {
    if (redo_.empty()) return std::nullopt;
    T state = std::move(redo_.back());
    redo_.pop_back();
    undo_.push_back(state);
    enforce_capacity();
    return state;
  }

  bool can_undo() const { return !undo_.empty(); }
  bool can_redo() const { return !redo_.empty(); }
  void clear() { undo_.clear(); redo_.clear(); }

  size_t size() const { return undo_.size(); }
  bool empty() const { return undo_.empty(); }
  size_t undo_count() const { return undo_.size(); }
  size_t redo_count() const { return redo_.size(); }
  size_t capacity() const { return capacity_; }

  // Drops every entry, on either side, for which pred returns true.
  template <typename Pred>
  void prune_if(Pred pred) {
    std::erase_if(undo_, pred);
    std::erase_if(redo_, pred);
  }

private:
  void enforce_capacity() {
    while (undo_.size() > capacity_) undo_.pop_front();
    while (redo_.size() > capacity_) redo_.pop_front();
  }

  std::deque<T> undo_;
  std::deque<T> redo_;
  size_t capacity_;
};

struct EditAction {
  enum Type { Insert, Delete, InsertText, DeleteText } type;
  size_t position = 0;
  std::string text;

  static EditAction insert_char(size_t pos, char c) { return {Insert, pos, std::string(1, c)}; }
  static EditAction delete_char(size_t pos, char c) { return {Delete, pos, std::string(1, c)}; }
  EditAction inverse() const;
  bool operator==(const EditAction&) const = default;
};

class ActionLog {
public:
  ActionLog() = default;
  explicit ActionLog(size_t capacity) : actions_(capacity) {}

  void start_group();
  void end_group();
  void record(const EditAction& action);
  std::optional<EditAction> undo_action();
  std::optional<EditAction> redo_action();
  bool can_undo() const { return actions_.can_undo(); }
  bool can_redo() const { return actions_.can_redo(); }
  bool grouping() const { return grouping_; }
  void clear();
  std::pair<size_t, size_t> stats() const { return {actions_.undo_count(), actions_.redo_count()}; }

private:
  HistoryStack<EditAction> actions_;
  bool grouping_ = false;
  std::vector<EditAction> current_;
};

template <typename T>
class TimedHistory {
public:
  using TimePoint = std::chrono::steady_clock::time_point;
  using ClockFn = std::function<TimePoint()>;

  explicit TimedHistory(std::chrono::steady_clock::duration max_age,
                        ClockFn now = [] { return std::chrono::steady_clock::now(); })
    : max_age_(max_age), now_(std::move(now)) {}

  void save_state(T state) {
    history_.save_state(Entry{std::move(state), now_()});
    expire();
  }

  std::optional<T> undo() {
    expire();
    auto e = history_.undo();
    if (!e) return std::nullopt;
    return e->value;
  }

  std::optional<T> redo() {
    expire();
    auto e = history_.redo();
    if (!e) return std::nullopt;
    return e->value;
  }

  bool can_undo() const { return history_.can_undo(); }
  bool can_redo() const { return history_.can_redo(); }
  void clear() { history_.clear(); }
  size_t size() const { return history_.size(); }

private:
  struct Entry {
    T value;
    TimePoint at;
  };

  void expire() {
    TimePoint now = now_();
    history_.prune_if([&](const Entry& e) { return now - e.at > max_age_; });
  }

  HistoryStack<Entry> history_;
  std::chrono::steady_clock::duration max_age_;
  ClockFn now_;
};
