#include "undo_manager.hpp"

EditAction EditAction::inverse() const {
  switch (type) {
    case Insert: return {Delete, position, text};
    case Delete: return {Insert, position, text};
    case InsertText: return {DeleteText, position, text};
    case DeleteText: return {InsertText, position, text};
  }
  return *this;
}

void ActionLog::start_group() {
  grouping_ = true;
  current_.clear();
}

// Only the last action of the group survives as its undo entry.
void ActionLog::end_group() {
  if (grouping_ && !current_.empty()) {
    actions_.save_state(current_.back());
  }
  grouping_ = false;
  current_.clear();
}

void ActionLog::record(const EditAction& action) {
  if (grouping_) {
    current_.push_back(action);
  } else {
    actions_.save_state(action);
  }
}

std::optional<EditAction> ActionLog::undo_action() {
  auto a = actions_.pop_undo();
  if (!a) return std::nullopt;
  return a->inverse();
}

std::optional<EditAction> ActionLog::redo_action() { return actions_.redo(); }

void ActionLog::clear() {
  actions_.clear();
  current_.clear();
  grouping_ = false;
}
