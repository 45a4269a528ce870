#pragma once
/*
 * UndoRedoManager
 *
 * Purpose: record edits, coalesce them into undo groups, replay groups backwards/forwards.
 * Grouping: a new group starts when none is open, after the grouping timeout, when the
 *   category changes, or when typing/deleting jumps away from the previous edit.
 * Note: owns no timer; the caller finalizes the open group on idle.
 */
#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "edit_command.hpp"
#include "text_content.hpp"

struct GroupingConfig {
  std::chrono::milliseconds grouping_timeout{TB_GROUPING_TIMEOUT_MS};
  size_t max_undo_groups = TB_MAX_UNDO_GROUPS;
  // single inserted characters accepted as Typing; default is an ASCII letter or digit
  std::function<bool(char)> typing_char;
};

using ClockFn = std::function<HistoryClock::time_point()>;

enum class HistoryState { Idle, GroupOpen };

class UndoRedoManager {
public:
  UndoRedoManager();
  explicit UndoRedoManager(GroupingConfig cfg, ClockFn clock = {});

  void record_command(EditKind kind, size_t position, std::string removed, std::string inserted,
                      size_t cursor_before, size_t cursor_after);
  void finalize_current_group();

  /*commands recorded between these calls form one group*/
  void begin_compound();
  void end_compound();

  bool undo(TextContent& content, size_t& cursor);
  bool redo(TextContent& content, size_t& cursor);
  void clear();

  bool can_undo() const;
  bool can_redo() const;
  size_t undo_size() const { return undo_groups_.size(); }
  size_t redo_size() const { return redo_groups_.size(); }
  HistoryState state() const { return current_ ? HistoryState::GroupOpen : HistoryState::Idle; }
  std::optional<GroupCategory> open_category() const;
  const CommandGroup* last_group() const;

  GroupCategory classify(EditKind kind, const std::string& inserted) const;
  const GroupingConfig& config() const { return cfg_; }
  void set_config(GroupingConfig cfg);

private:
  bool should_start_new_group(GroupCategory category, size_t position, HistoryClock::time_point now) const;
  void push_undo(CommandGroup group);

  std::deque<CommandGroup> undo_groups_;
  std::vector<CommandGroup> redo_groups_;
  std::optional<CommandGroup> current_;
  std::optional<HistoryClock::time_point> last_action_;
  int compound_depth_ = 0;
  bool compound_open_ = false;
  GroupingConfig cfg_;
  ClockFn clock_;
};
