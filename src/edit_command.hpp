#pragma once
/*
 * EditCommand / CommandGroup
 *
 * Purpose: records of what changed in the document, as kept by UndoRedoManager.
 * EditCommand: one atomic mutation, fixed at construction.
 * CommandGroup: time-ordered commands that undo/redo as one unit.
 */
#include <chrono>
#include <string>
#include <utility>
#include <vector>

using HistoryClock = std::chrono::steady_clock;

enum class EditKind { Insert, Delete, Backspace, Replace };

enum class GroupCategory { Typing, NewLine, Paste, Deletion, Replace, Insert, Other };

class EditCommand {
public:
  EditCommand(EditKind kind, size_t position, std::string removed, std::string inserted,
              size_t cursor_before, size_t cursor_after, HistoryClock::time_point timestamp)
    : kind_(kind), position_(position), removed_(std::move(removed)), inserted_(std::move(inserted)),
      cursor_before_(cursor_before), cursor_after_(cursor_after), timestamp_(timestamp) {}

  EditKind kind() const { return kind_; }
  // offset in the content before the mutation
  size_t position() const { return position_; }
  const std::string& removed_text() const { return removed_; }
  const std::string& inserted_text() const { return inserted_; }
  size_t cursor_before() const { return cursor_before_; }
  size_t cursor_after() const { return cursor_after_; }
  HistoryClock::time_point timestamp() const { return timestamp_; }

private:
  EditKind kind_;
  size_t position_;
  std::string removed_;
  std::string inserted_;
  size_t cursor_before_;
  size_t cursor_after_;
  HistoryClock::time_point timestamp_;
};

class CommandGroup {
public:
  CommandGroup(GroupCategory category, HistoryClock::time_point start)
    : category_(category), start_(start), end_(start) {}

  void add_command(EditCommand cmd) {
    end_ = cmd.timestamp();
    commands_.push_back(std::move(cmd));
  }

  GroupCategory category() const { return category_; }
  const std::vector<EditCommand>& commands() const { return commands_; }
  const EditCommand& back() const { return commands_.back(); }
  bool empty() const { return commands_.empty(); }
  size_t size() const { return commands_.size(); }
  HistoryClock::time_point start_time() const { return start_; }
  HistoryClock::time_point end_time() const { return end_; }

private:
  GroupCategory category_;
  HistoryClock::time_point start_;
  HistoryClock::time_point end_;
  std::vector<EditCommand> commands_;
};
