#include "undo_manager.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

static size_t offset_gap(size_t a, size_t b) { return a > b ? a - b : b - a; }

static bool default_typing_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; }

// a command whose offsets no longer fit the content is skipped
static void apply_inverse(TextContent& content, const EditCommand& cmd) {
  size_t len = content.length();
  size_t pos = cmd.position();
  switch (cmd.kind()) {
    case EditKind::Insert:
      if (pos <= len && cmd.inserted_text().size() <= len - pos) content.erase(pos, cmd.inserted_text().size());
      break;
    case EditKind::Delete:
    case EditKind::Backspace:
      if (pos <= len) content.insert(pos, cmd.removed_text());
      break;
    case EditKind::Replace:
      if (pos <= len && cmd.inserted_text().size() <= len - pos) {
        content.erase(pos, cmd.inserted_text().size());
        content.insert(pos, cmd.removed_text());
      }
      break;
  }
}

static void apply_forward(TextContent& content, const EditCommand& cmd) {
  size_t len = content.length();
  size_t pos = cmd.position();
  switch (cmd.kind()) {
    case EditKind::Insert:
      if (pos <= len) content.insert(pos, cmd.inserted_text());
      break;
    case EditKind::Delete:
    case EditKind::Backspace:
      if (pos <= len && cmd.removed_text().size() <= len - pos) content.erase(pos, cmd.removed_text().size());
      break;
    case EditKind::Replace:
      if (pos <= len && cmd.removed_text().size() <= len - pos) {
        content.erase(pos, cmd.removed_text().size());
        content.insert(pos, cmd.inserted_text());
      }
      break;
  }
}

UndoRedoManager::UndoRedoManager() : UndoRedoManager(GroupingConfig{}) {}

UndoRedoManager::UndoRedoManager(GroupingConfig cfg, ClockFn clock)
  : cfg_(std::move(cfg)), clock_(std::move(clock)) {
  if (!cfg_.typing_char) cfg_.typing_char = default_typing_char;
  if (!clock_) clock_ = [] { return HistoryClock::now(); };
}

void UndoRedoManager::set_config(GroupingConfig cfg) {
  cfg_ = std::move(cfg);
  if (!cfg_.typing_char) cfg_.typing_char = default_typing_char;
  while (undo_groups_.size() > cfg_.max_undo_groups) undo_groups_.pop_front();
}

GroupCategory UndoRedoManager::classify(EditKind kind, const std::string& inserted) const {
  switch (kind) {
    case EditKind::Insert:
      if (inserted.size() == 1 && cfg_.typing_char(inserted[0])) return GroupCategory::Typing;
      if (inserted == "\n") return GroupCategory::NewLine;
      if (inserted.size() > 1) return GroupCategory::Paste;
      return GroupCategory::Insert;
    case EditKind::Delete:
    case EditKind::Backspace:
      return GroupCategory::Deletion;
    case EditKind::Replace:
      return GroupCategory::Replace;
  }
  return GroupCategory::Other;
}

bool UndoRedoManager::should_start_new_group(GroupCategory category, size_t position,
                                             HistoryClock::time_point now) const {
  if (!current_ || current_->empty()) return true;
  if (!last_action_ || now - *last_action_ > cfg_.grouping_timeout) return true;
  if (category != current_->category()) return true;
  const EditCommand& last = current_->back();
  if (category == GroupCategory::Typing) {
    return offset_gap(position, last.position() + last.inserted_text().size()) > 1;
  }
  if (category == GroupCategory::Deletion) {
    return offset_gap(position, last.position()) > 1;
  }
  return false;
}

void UndoRedoManager::record_command(EditKind kind, size_t position, std::string removed, std::string inserted,
                                     size_t cursor_before, size_t cursor_after) {
  redo_groups_.clear();
  HistoryClock::time_point now = clock_();
  GroupCategory category = classify(kind, inserted);
  bool start_new;
  if (compound_depth_ > 0) {
    start_new = !compound_open_;
    category = GroupCategory::Replace;
    compound_open_ = true;
  } else {
    start_new = should_start_new_group(category, position, now);
  }
  if (start_new) {
    finalize_current_group();
    current_.emplace(category, now);
  }
  current_->add_command(EditCommand(kind, position, std::move(removed), std::move(inserted),
                                    cursor_before, cursor_after, now));
  last_action_ = now;
}

void UndoRedoManager::push_undo(CommandGroup group) {
  undo_groups_.push_back(std::move(group));
  while (undo_groups_.size() > cfg_.max_undo_groups) undo_groups_.pop_front();
}

void UndoRedoManager::finalize_current_group() {
  if (current_ && !current_->empty()) push_undo(std::move(*current_));
  current_.reset();
}

void UndoRedoManager::begin_compound() {
  if (compound_depth_ == 0) {
    finalize_current_group();
    compound_open_ = false;
  }
  ++compound_depth_;
}

void UndoRedoManager::end_compound() {
  if (compound_depth_ == 0) return;
  if (--compound_depth_ == 0) {
    if (compound_open_) finalize_current_group();
    compound_open_ = false;
  }
}

bool UndoRedoManager::undo(TextContent& content, size_t& cursor) {
  finalize_current_group();
  if (undo_groups_.empty()) return false;
  CommandGroup group = std::move(undo_groups_.back());
  undo_groups_.pop_back();
  size_t cur = cursor;
  const auto& cmds = group.commands();
  for (auto it = cmds.rbegin(); it != cmds.rend(); ++it) {
    apply_inverse(content, *it);
    cur = it->cursor_before();
  }
  cursor = std::min(cur, content.length());
  redo_groups_.push_back(std::move(group));
  return true;
}

bool UndoRedoManager::redo(TextContent& content, size_t& cursor) {
  finalize_current_group();
  if (redo_groups_.empty()) return false;
  CommandGroup group = std::move(redo_groups_.back());
  redo_groups_.pop_back();
  size_t cur = cursor;
  for (const EditCommand& cmd : group.commands()) {
    apply_forward(content, cmd);
    cur = cmd.cursor_after();
  }
  cursor = std::min(cur, content.length());
  push_undo(std::move(group));
  return true;
}

void UndoRedoManager::clear() {
  undo_groups_.clear();
  redo_groups_.clear();
  current_.reset();
  last_action_.reset();
  compound_depth_ = 0;
  compound_open_ = false;
}

bool UndoRedoManager::can_undo() const {
  return !undo_groups_.empty() || (current_ && !current_->empty());
}

bool UndoRedoManager::can_redo() const { return !redo_groups_.empty(); }

std::optional<GroupCategory> UndoRedoManager::open_category() const {
  if (!current_) return std::nullopt;
  return current_->category();
}

const CommandGroup* UndoRedoManager::last_group() const {
  if (undo_groups_.empty()) return nullptr;
  return &undo_groups_.back();
}
