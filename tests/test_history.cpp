#include "undo_manager.hpp"
#include <cassert>
#include <chrono>
#include <string>

static void run_snapshot_tests() {
  HistoryStack<std::string> h;
  assert(h.capacity() == BUFED_MAX_HISTORY);
  assert(!h.undo().has_value());
  assert(!h.redo().has_value());

  h.save_state("a");
  h.save_state("b");
  assert(h.undo() == std::optional<std::string>("a"));
  assert(h.redo() == std::optional<std::string>("b"));

  h.undo();
  h.save_state("c");
  assert(!h.can_redo());
  assert(h.undo_count() == 2);

  HistoryStack<int> small(2);
  small.save_state(1);
  small.save_state(2);
  small.save_state(3);
  assert(small.size() == 2);
  assert(small.undo() == std::optional<int>(2));
  assert(!small.undo().has_value());
  assert(small.empty());
  assert(small.redo_count() == 2);

  HistoryStack<std::string> p;
  p.save_state("x");
  p.save_state("y");
  assert(p.pop_undo() == std::optional<std::string>("y"));
  assert(p.redo() == std::optional<std::string>("y"));
  p.clear();
  assert(!p.can_undo() && !p.can_redo());

  HistoryStack<int> q;
  for (int i = 0; i < 6; ++i) q.save_state(i);
  q.undo();
  q.prune_if([](int v) { return v % 2 == 0; });
  assert(q.undo_count() == 2);
  assert(q.redo_count() == 1);
}

static void run_action_log_tests() {
  EditAction ins = EditAction::insert_char(0, 'a');
  assert(ins.inverse() == EditAction::delete_char(0, 'a'));
  EditAction text{EditAction::InsertText, 3, "xyz"};
  assert(text.inverse().type == EditAction::DeleteText);
  assert(text.inverse().inverse() == text);

  ActionLog log;
  assert(!log.can_undo());
  log.record(ins);
  log.record(EditAction::insert_char(1, 'b'));
  assert(log.stats() == std::make_pair(size_t{2}, size_t{0}));

  auto u = log.undo_action();
  assert(u.has_value());
  assert(*u == EditAction::delete_char(1, 'b'));
  assert(log.stats() == std::make_pair(size_t{1}, size_t{1}));
  auto r = log.redo_action();
  assert(r.has_value());
  assert(*r == EditAction::insert_char(1, 'b'));

  log.clear();
  log.start_group();
  assert(log.grouping());
  log.record(EditAction::insert_char(0, 'x'));
  log.record(EditAction::insert_char(1, 'y'));
  log.record(EditAction::insert_char(2, 'z'));
  assert(!log.can_undo());
  log.end_group();
  assert(!log.grouping());
  assert(log.stats().first == 1);
  assert(*log.undo_action() == EditAction::delete_char(2, 'z'));
  assert(!log.undo_action().has_value());

  log.start_group();
  log.end_group();
  assert(!log.can_undo());
}

static void run_timed_tests() {
  using namespace std::chrono;
  steady_clock::time_point t{};
  TimedHistory<int> th(seconds(10), [&t] { return t; });
  th.save_state(1);
  t += seconds(5);
  th.save_state(2);
  assert(th.size() == 2);

  t += seconds(7);
  // entry 1 is now 12s old and expires; 2 is the only one left
  assert(!th.undo().has_value());
  assert(th.size() == 0);
  assert(th.redo() == std::optional<int>(2));

  t += seconds(30);
  th.save_state(3);
  assert(th.size() == 1);
  assert(!th.can_redo());
  th.clear();
  assert(!th.can_undo());
}

int main() {
  run_snapshot_tests();
  run_action_log_tests();
  run_timed_tests();
  return 0;
}
