#include "text_buffer.hpp"
#include <algorithm>
#include <cctype>
#include <fcntl.h>
#include <sys/stat.h>
#include "posix_fd.hpp"
#include "file_reader.hpp"
#include "config.hpp"

static inline bool is_word(char c) {
  unsigned char u = static_cast<unsigned char>(c);
  return std::isalnum(u) != 0 || c == '_';
}

static size_t clamp_offset(std::ptrdiff_t v, size_t len) {
  if (v <= 0) return 0;
  return std::min(static_cast<size_t>(v), len);
}

TextBuffer::TextBuffer() : TextBuffer(std::string_view{}) {}

TextBuffer::TextBuffer(std::string_view initial, GroupingConfig cfg, ClockFn clock)
  : history_(std::move(cfg), std::move(clock)) {
  set_content(initial);
}

std::string_view TextBuffer::backend_name() const {
  return core_.get_name();
}

std::string TextBuffer::text_range(size_t start, size_t end) const {
  if (end < start) std::swap(start, end);
  return core_.slice(start, end - start);
}

void TextBuffer::set_content(std::string_view content) {
  core_.assign(content);
  cursor_ = 0;
  clear_selection();
  history_.clear();
  touch();
}

const LineIndex& TextBuffer::lines() const {
  if (lines_dirty_) {
    line_index_.rebuild(core_);
    lines_dirty_ = false;
  }
  return line_index_;
}

size_t TextBuffer::line_count() const { return lines().line_count(); }

std::string TextBuffer::line(size_t row) const {
  if (row >= line_count()) return std::string();
  return text_range(line_start(row), line_end(row));
}

size_t TextBuffer::line_start(size_t row) const { return lines().line_start(row); }

size_t TextBuffer::line_end(size_t row) const { return lines().line_end(row, core_.length()); }

size_t TextBuffer::cursor_row() const { return lines().row_of(cursor_); }

size_t TextBuffer::cursor_col() const { return cursor_ - line_start(cursor_row()); }

std::string TextBuffer::current_line_indentation() const {
  std::string indent;
  for (size_t i = line_start(cursor_row()); i < cursor_; ++i) {
    char c = core_.at(i);
    if (c != ' ' && c != '\t') break;
    indent.push_back(c);
  }
  return indent;
}

void TextBuffer::insert_text(std::string_view text) {
  if (text.empty()) return;
  bool replacing = has_selection();
  if (replacing) {
    history_.begin_compound();
    delete_selected_text();
  }
  size_t pos = cursor_;
  history_.record_command(EditKind::Insert, pos, std::string(), std::string(text), pos, pos + text.size());
  core_.insert(pos, text);
  cursor_ = pos + text.size();
  if (replacing) history_.end_compound();
  clear_selection();
  touch();
}

void TextBuffer::perform_backspace(bool word_mode) {
  if (has_selection()) {
    delete_selected_text();
  } else if (word_mode) {
    delete_word_backward();
  } else if (cursor_ > 0) {
    size_t pos = cursor_ - 1;
    history_.record_command(EditKind::Backspace, pos, core_.slice(pos, 1), std::string(), cursor_, pos);
    core_.erase(pos, 1);
    cursor_ = pos;
    clear_selection();
    touch();
  }
}

void TextBuffer::perform_delete(bool word_mode) {
  if (has_selection()) {
    delete_selected_text();
  } else if (word_mode) {
    delete_word_forward();
  } else if (cursor_ < core_.length()) {
    history_.record_command(EditKind::Delete, cursor_, core_.slice(cursor_, 1), std::string(), cursor_, cursor_);
    core_.erase(cursor_, 1);
    clear_selection();
    touch();
  }
}

void TextBuffer::replace_range(size_t start, size_t end, std::string_view text) {
  size_t len = core_.length();
  start = std::min(start, len);
  end = std::min(end, len);
  if (end < start) std::swap(start, end);
  std::string removed = core_.slice(start, end - start);
  if (removed == text) return;
  history_.record_command(EditKind::Replace, start, removed, std::string(text), cursor_, start + text.size());
  core_.erase(start, removed.size());
  core_.insert(start, text);
  cursor_ = start + text.size();
  clear_selection();
  touch();
}

void TextBuffer::delete_selected_text() {
  auto range = selection_range();
  if (!range) return;
  std::string removed = core_.slice(range->start, range->end - range->start);
  history_.record_command(EditKind::Delete, range->start, removed, std::string(), cursor_, range->start);
  core_.erase(range->start, removed.size());
  cursor_ = range->start;
  clear_selection();
  touch();
}

size_t TextBuffer::word_start_from(size_t pos) const {
  size_t i = pos;
  while (i > 0 && !is_word(core_.at(i - 1))) --i;
  while (i > 0 && is_word(core_.at(i - 1))) --i;
  return i;
}

// one run per call: the word under the cursor, or else the gap after it, so
// "foo  bar" steps 0 -> 3 -> 5. stops at the end of the current line and never
// moves past '\n'.
size_t TextBuffer::word_end_from(size_t pos) const {
  size_t line_end = core_.find('\n', pos);
  if (line_end == TextContent::npos) line_end = core_.length();
  size_t i = pos;
  while (i < line_end && is_word(core_.at(i))) ++i;
  if (i == pos) {
    while (i < line_end && !is_word(core_.at(i))) ++i;
  }
  return i;
}

void TextBuffer::delete_word_backward() {
  size_t start = word_start_from(cursor_);
  if (start == cursor_) return;
  history_.record_command(EditKind::Delete, start, core_.slice(start, cursor_ - start), std::string(), cursor_, start);
  core_.erase(start, cursor_ - start);
  cursor_ = start;
  clear_selection();
  touch();
}

void TextBuffer::delete_word_forward() {
  size_t end = word_end_from(cursor_);
  if (end == cursor_) return;
  history_.record_command(EditKind::Delete, cursor_, core_.slice(cursor_, end - cursor_), std::string(), cursor_, cursor_);
  core_.erase(cursor_, end - cursor_);
  clear_selection();
  touch();
}

void TextBuffer::move_cursor(std::ptrdiff_t delta) {
  set_cursor_position(static_cast<std::ptrdiff_t>(cursor_) + delta);
}

void TextBuffer::set_cursor_position(std::ptrdiff_t pos) {
  cursor_ = clamp_offset(pos, core_.length());
}

void TextBuffer::move_cursor_line(std::ptrdiff_t delta) {
  std::ptrdiff_t row = static_cast<std::ptrdiff_t>(cursor_row()) + delta;
  std::ptrdiff_t last = static_cast<std::ptrdiff_t>(line_count()) - 1;
  row = std::clamp<std::ptrdiff_t>(row, 0, last);
  size_t col = cursor_col();
  size_t start = line_start(static_cast<size_t>(row));
  size_t end = line_end(static_cast<size_t>(row));
  cursor_ = start + std::min(col, end - start);
}

void TextBuffer::move_to_line_start() { cursor_ = line_start(cursor_row()); }

void TextBuffer::move_to_line_end() { cursor_ = line_end(cursor_row()); }

void TextBuffer::move_to_word_start() { cursor_ = word_start_from(cursor_); }

void TextBuffer::move_to_word_end() { cursor_ = word_end_from(cursor_); }

bool TextBuffer::has_selection() const {
  return sel_anchor_ && sel_floating_ && *sel_anchor_ != *sel_floating_;
}

std::optional<SelectionRange> TextBuffer::selection_range() const {
  if (!has_selection()) return std::nullopt;
  size_t len = core_.length();
  size_t a = std::min(*sel_anchor_, len);
  size_t b = std::min(*sel_floating_, len);
  if (a == b) return std::nullopt;
  return SelectionRange{std::min(a, b), std::max(a, b)};
}

void TextBuffer::start_selection() {
  sel_anchor_ = cursor_;
  sel_floating_ = cursor_;
  selecting_ = true;
}

void TextBuffer::update_selection() {
  if (selecting_) sel_floating_ = cursor_;
}

void TextBuffer::clear_selection() {
  sel_anchor_.reset();
  sel_floating_.reset();
  selecting_ = false;
}

void TextBuffer::select_all() {
  sel_anchor_ = 0;
  sel_floating_ = core_.length();
  cursor_ = core_.length();
  selecting_ = true;
}

std::string TextBuffer::get_selected_text() const {
  auto range = selection_range();
  if (!range) return std::string();
  return core_.slice(range->start, range->end - range->start);
}

bool TextBuffer::undo() {
  size_t cur = cursor_;
  bool changed = history_.undo(core_, cur);
  cursor_ = std::min(cur, core_.length());
  clear_selection();
  if (changed) touch();
  return changed;
}

bool TextBuffer::redo() {
  size_t cur = cursor_;
  bool changed = history_.redo(core_, cur);
  cursor_ = std::min(cur, core_.length());
  clear_selection();
  if (changed) touch();
  return changed;
}

bool TextBuffer::load_file(const std::filesystem::path& path, std::string& msg) {
  std::string text;
  if (!mmap_read_text(path, text, msg)) return false;
  set_content(text);
  return true;
}

bool TextBuffer::write_file(const std::filesystem::path& path, std::string& msg) const {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  UniqueFd ufd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!ufd.valid()) {
    msg = std::string("write file failed: ") + tmp.string();
    return false;
  }
  std::error_code ec;
  size_t total = core_.length();
  const size_t chunk = static_cast<size_t>(TB_WRITE_CHUNK_SIZE);
  for (size_t pos = 0; pos < total; pos += chunk) {
    std::string part = core_.slice(pos, chunk);
    if (!ufd.write_all(part.data(), part.size())) {
      ufd.reset();
      std::filesystem::remove(tmp, ec);
      msg = std::string("write file failed: ") + tmp.string();
      return false;
    }
  }
  if (!ufd.sync_data()) {
    ufd.reset();
    std::filesystem::remove(tmp, ec);
    msg = std::string("write file failed: ") + tmp.string();
    return false;
  }
  ufd.reset();
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    msg = std::string("write file failed: ") + path.string();
    return false;
  }
  msg = std::string("saved file: ") + path.string();
  return true;
}
