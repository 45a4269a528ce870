#pragma once
/*
 * TextBuffer
 *
 * Purpose: the document: flat content, cursor offset, selection, and its undo history.
 * Rule: every content mutation is recorded in UndoRedoManager before it is applied.
 * Feature: safe writes (write .tmp → fdatasync → atomic rename).
 * Note: positions are clamped into [0, length]; no operation throws.
 */
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include "text_content.hpp"
#include "line_index.hpp"
#include "undo_manager.hpp"
#include "types.hpp"

class TextBuffer {
public:
  TextBuffer();
  explicit TextBuffer(std::string_view initial, GroupingConfig cfg = {}, ClockFn clock = {});

  std::string_view backend_name() const;
  std::string content() const { return core_.str(); }
  size_t length() const { return core_.length(); }
  char char_at(size_t i) const { return core_.at(i); }
  std::string text_range(size_t start, size_t end) const;
  size_t cursor() const { return cursor_; }
  /*bumped on every content change*/
  size_t revision() const { return revision_; }
  /*replace everything; resets cursor, selection and history (not undoable)*/
  void set_content(std::string_view content);

  size_t line_count() const;
  std::string line(size_t row) const;
  size_t line_start(size_t row) const;
  size_t line_end(size_t row) const;
  size_t cursor_row() const;
  size_t cursor_col() const;
  std::string current_line_indentation() const;

  void insert_text(std::string_view text);
  void perform_backspace(bool word_mode);
  void perform_delete(bool word_mode);
  void replace_range(size_t start, size_t end, std::string_view text);

  void move_cursor(std::ptrdiff_t delta);
  void set_cursor_position(std::ptrdiff_t pos);
  void move_cursor_line(std::ptrdiff_t delta);
  void move_to_line_start();
  void move_to_line_end();
  void move_to_word_start();
  void move_to_word_end();

  bool has_selection() const;
  std::optional<SelectionRange> selection_range() const;
  bool is_selecting() const { return selecting_; }
  void start_selection();
  void update_selection();
  void clear_selection();
  void select_all();
  std::string get_selected_text() const;

  bool undo();
  bool redo();
  void finalize_current_group() { history_.finalize_current_group(); }
  bool can_undo() const { return history_.can_undo(); }
  bool can_redo() const { return history_.can_redo(); }
  const UndoRedoManager& history() const { return history_; }
  void set_grouping_config(GroupingConfig cfg) { history_.set_config(std::move(cfg)); }

  bool load_file(const std::filesystem::path& path, std::string& msg);
  bool write_file(const std::filesystem::path& path, std::string& msg) const;

private:
  void delete_selected_text();
  void delete_word_backward();
  void delete_word_forward();
  size_t word_start_from(size_t pos) const;
  size_t word_end_from(size_t pos) const;
  const LineIndex& lines() const;
  void touch() { lines_dirty_ = true; ++revision_; }

  TextContent core_;
  size_t cursor_ = 0;
  std::optional<size_t> sel_anchor_;
  std::optional<size_t> sel_floating_;
  bool selecting_ = false;
  size_t revision_ = 0;
  UndoRedoManager history_;
  mutable LineIndex line_index_;
  mutable bool lines_dirty_ = true;
};
