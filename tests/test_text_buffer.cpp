#include "text_buffer.hpp"
#include "fake_clock.hpp"
#include <cassert>
#include <string>
#include <vector>

static void type_chars(TextBuffer& b, const std::string& s) {
  for (char c : s) b.insert_text(std::string(1, c));
}

static void test_inverse_law() {
  const std::vector<std::string> contents = {"", "abc", "hello world", "line1\nline2\n", "  x_y  "};
  const std::vector<std::string> texts = {"a", " ", "\n", "pasted text", "\n\t"};
  for (const auto& content : contents) {
    for (size_t pos = 0; pos <= content.size(); ++pos) {
      for (const auto& t : texts) {
        TextBuffer b(content);
        b.set_cursor_position(static_cast<std::ptrdiff_t>(pos));
        b.insert_text(t);
        assert(b.content() == content.substr(0, pos) + t + content.substr(pos));
        assert(b.undo());
        assert(b.content() == content);
        assert(b.cursor() == pos);
        assert(b.redo());
        assert(b.cursor() == pos + t.size());
      }
      TextBuffer bs(content);
      bs.set_cursor_position(static_cast<std::ptrdiff_t>(pos));
      bs.perform_backspace(false);
      bs.undo();
      assert(bs.content() == content);

      TextBuffer del(content);
      del.set_cursor_position(static_cast<std::ptrdiff_t>(pos));
      del.perform_delete(true);
      del.undo();
      assert(del.content() == content);
    }
  }
}

static void test_redo_invalidation() {
  TextBuffer b("x");
  b.set_cursor_position(1);
  b.insert_text("a");
  assert(b.undo());
  assert(b.can_redo());
  b.insert_text("b");
  assert(!b.can_redo());
  assert(!b.redo());
  assert(b.content() == "xb");
}

static void test_contiguous_typing_groups() {
  FakeClock clock;
  TextBuffer b("", GroupingConfig{}, clock.fn());
  type_chars(b, "abc");
  assert(b.content() == "abc");
  assert(b.undo());
  assert(b.content().empty());
  assert(b.cursor() == 0);
  assert(!b.can_undo());
}

static void test_timeout_separates_groups() {
  FakeClock clock;
  TextBuffer b("", GroupingConfig{}, clock.fn());
  b.insert_text("a");
  clock.advance(1001);
  b.insert_text("b");
  assert(b.undo());
  assert(b.content() == "a");
  assert(b.cursor() == 1);
}

static void test_word_then_space_are_separate() {
  FakeClock clock;
  TextBuffer b("", GroupingConfig{}, clock.fn());
  type_chars(b, "ab");
  b.insert_text(" ");
  type_chars(b, "cd");
  assert(b.content() == "ab cd");
  assert(b.undo());
  assert(b.content() == "ab ");
  assert(b.undo());
  assert(b.content() == "ab");
  assert(b.undo());
  assert(b.content().empty());
}

static void test_redo_ends_typing_run() {
  FakeClock clock;
  TextBuffer b("", GroupingConfig{}, clock.fn());
  b.insert_text("a");
  assert(!b.redo());
  assert(b.history().state() == HistoryState::Idle);
  b.insert_text("b");
  assert(b.undo());
  assert(b.content() == "a");
}

static void test_newlines_group() {
  FakeClock clock;
  TextBuffer b("x", GroupingConfig{}, clock.fn());
  b.set_cursor_position(1);
  b.insert_text("\n");
  b.insert_text("\n");
  b.insert_text("\n");
  assert(b.content() == "x\n\n\n");
  assert(b.undo());
  assert(b.content() == "x");
  assert(!b.can_undo());
}

static void test_moving_away_starts_new_group() {
  FakeClock clock;
  TextBuffer b("0123456789", GroupingConfig{}, clock.fn());
  b.set_cursor_position(2);
  type_chars(b, "ab");
  b.set_cursor_position(9);
  type_chars(b, "cd");
  assert(b.content() == "01ab23456cd789");
  assert(b.undo());
  assert(b.content() == "01ab23456789");
  assert(b.undo());
  assert(b.content() == "0123456789");
}

static void test_capacity() {
  FakeClock clock;
  TextBuffer b("", GroupingConfig{}, clock.fn());
  for (int i = 0; i < 150; ++i) {
    b.insert_text("x");
    clock.advance(1001);
  }
  int undone = 0;
  while (b.undo()) undone++;
  assert(undone == 100);
  assert(b.length() == 50);
}

static void test_selection_replace_is_one_unit() {
  FakeClock clock;
  TextBuffer b("foobarbaz", GroupingConfig{}, clock.fn());
  b.set_cursor_position(3);
  b.start_selection();
  b.set_cursor_position(6);
  b.update_selection();
  assert(b.has_selection());
  assert(b.get_selected_text() == "bar");
  b.insert_text("X");
  assert(b.content() == "fooXbaz");
  assert(b.cursor() == 4);
  assert(!b.has_selection());
  const CommandGroup* g = b.history().last_group();
  assert(g != nullptr);
  assert(g->size() == 2);
  assert(g->category() == GroupCategory::Replace);
  assert(g->commands()[0].kind() == EditKind::Delete);
  assert(g->commands()[1].kind() == EditKind::Insert);

  assert(b.undo());
  assert(b.content() == "foobarbaz");
  assert(b.redo());
  assert(b.content() == "fooXbaz");
  assert(b.cursor() == 4);

  // typing after the replacement is its own group
  b.insert_text("y");
  assert(b.undo());
  assert(b.content() == "fooXbaz");
}

static void test_word_navigation() {
  TextBuffer b("foo  bar\nbaz");
  b.set_cursor_position(0);
  b.move_to_word_end();
  assert(b.cursor() == 3);
  b.move_to_word_end();
  assert(b.cursor() == 5);
  b.move_to_word_end();
  assert(b.cursor() == 8);
  b.move_to_word_end();
  assert(b.cursor() == 8);

  b.set_cursor_position(9);
  b.move_to_word_start();
  assert(b.cursor() == 5);
  b.move_to_word_start();
  assert(b.cursor() == 0);
  b.move_to_word_start();
  assert(b.cursor() == 0);

  TextBuffer u("a_b1 c");
  u.set_cursor_position(0);
  u.move_to_word_end();
  assert(u.cursor() == 4);
}

static void test_bounds_are_no_ops() {
  TextBuffer b("abc");
  size_t rev = b.revision();
  b.set_cursor_position(0);
  b.perform_backspace(false);
  b.perform_backspace(true);
  assert(b.content() == "abc");
  b.set_cursor_position(3);
  b.perform_delete(false);
  b.perform_delete(true);
  assert(b.content() == "abc");
  b.insert_text("");
  assert(b.revision() == rev);
  assert(!b.can_undo());
  assert(!b.undo());
  assert(!b.redo());
  assert(b.revision() == rev);
}

static void test_cursor_clamping() {
  TextBuffer b("hello");
  b.set_cursor_position(-5);
  assert(b.cursor() == 0);
  b.set_cursor_position(100);
  assert(b.cursor() == 5);
  b.move_cursor(-2);
  assert(b.cursor() == 3);
  b.move_cursor(50);
  assert(b.cursor() == 5);
  b.move_cursor(-50);
  assert(b.cursor() == 0);
}

static void test_backspace_run() {
  FakeClock clock;
  TextBuffer b("abc", GroupingConfig{}, clock.fn());
  b.set_cursor_position(3);
  b.perform_backspace(false);
  b.perform_backspace(false);
  b.perform_backspace(false);
  assert(b.content().empty());
  assert(b.undo());
  assert(b.content() == "abc");
  assert(b.cursor() == 3);
  assert(!b.can_undo());
}

static void test_forward_delete_run() {
  FakeClock clock;
  TextBuffer b("abcdef", GroupingConfig{}, clock.fn());
  b.set_cursor_position(1);
  b.perform_delete(false);
  b.perform_delete(false);
  assert(b.content() == "adef");
  assert(b.cursor() == 1);
  assert(b.undo());
  assert(b.content() == "abcdef");
  assert(b.cursor() == 1);
}

static void test_word_deletes() {
  TextBuffer b("hello world");
  b.set_cursor_position(11);
  b.perform_backspace(true);
  assert(b.content() == "hello ");
  assert(b.cursor() == 6);
  b.perform_backspace(true);
  assert(b.content().empty());
  assert(b.undo());
  assert(b.content() == "hello ");
  assert(b.cursor() == 6);
  assert(b.undo());
  assert(b.content() == "hello world");
  assert(b.cursor() == 11);

  TextBuffer f("foo bar");
  f.set_cursor_position(0);
  f.perform_delete(true);
  assert(f.content() == " bar");
  f.perform_delete(true);
  assert(f.content() == "bar");
  assert(f.cursor() == 0);

  TextBuffer nl("ab\ncd");
  nl.set_cursor_position(2);
  size_t rev = nl.revision();
  nl.perform_delete(true);
  assert(nl.content() == "ab\ncd");
  assert(nl.revision() == rev);
}

static void test_word_mode_deletes_selection() {
  TextBuffer b("one two three");
  b.set_cursor_position(4);
  b.start_selection();
  b.set_cursor_position(6);
  b.update_selection();
  b.perform_backspace(true);
  assert(b.content() == "one o three");
  assert(b.cursor() == 4);
  assert(!b.has_selection());

  b.set_cursor_position(0);
  b.start_selection();
  b.set_cursor_position(4);
  b.update_selection();
  b.perform_delete(true);
  assert(b.content() == "o three");
}

static void test_selection_queries() {
  TextBuffer b("hello");
  b.set_cursor_position(5);
  b.start_selection();
  assert(b.is_selecting());
  assert(!b.has_selection());
  assert(!b.selection_range());
  b.move_cursor(-3);
  b.update_selection();
  auto r = b.selection_range();
  assert(r && r->start == 2 && r->end == 5);
  assert(b.get_selected_text() == "llo");
  b.clear_selection();
  assert(!b.has_selection());
  assert(b.get_selected_text().empty());

  b.select_all();
  assert(b.get_selected_text() == "hello");
  assert(b.cursor() == 5);
  b.insert_text("bye");
  assert(b.content() == "bye");
  assert(b.undo());
  assert(b.content() == "hello");
  assert(!b.has_selection());
}

static void test_set_content_resets() {
  TextBuffer b("abc");
  b.set_cursor_position(3);
  b.insert_text("d");
  b.select_all();
  b.set_content("new");
  assert(b.content() == "new");
  assert(b.cursor() == 0);
  assert(!b.has_selection());
  assert(!b.can_undo());
  assert(!b.can_redo());
}

static void test_replace_range() {
  TextBuffer b("hello world");
  size_t rev = b.revision();
  b.replace_range(0, 5, "hello");
  assert(b.revision() == rev);
  assert(!b.can_undo());

  b.replace_range(0, 5, "HELLO");
  assert(b.content() == "HELLO world");
  assert(b.cursor() == 5);
  b.replace_range(100, 6, "!");
  assert(b.content() == "HELLO !");
  assert(b.undo());
  assert(b.content() == "hello world");
  assert(b.redo());
  assert(b.content() == "HELLO !");
  assert(b.cursor() == 7);
}

static void test_line_helpers() {
  TextBuffer b("ab\ncd\n");
  assert(b.line_count() == 3);
  assert(b.line(0) == "ab");
  assert(b.line(1) == "cd");
  assert(b.line(2).empty());
  assert(b.line(9).empty());
  b.set_cursor_position(1);
  b.move_cursor_line(1);
  assert(b.cursor() == 4);
  assert(b.cursor_row() == 1);
  assert(b.cursor_col() == 1);
  b.move_cursor_line(1);
  assert(b.cursor() == 6);
  b.move_cursor_line(-5);
  assert(b.cursor() == 0);
  b.set_cursor_position(4);
  b.move_to_line_end();
  assert(b.cursor() == 5);
  b.move_to_line_start();
  assert(b.cursor() == 3);

  TextBuffer ind("  x\n\tyz");
  ind.set_cursor_position(3);
  assert(ind.current_line_indentation() == "  ");
  ind.set_cursor_position(1);
  assert(ind.current_line_indentation() == " ");
  ind.set_cursor_position(7);
  assert(ind.current_line_indentation() == "\t");
}

static void test_revision_and_lines_follow_edits() {
  TextBuffer b("a");
  size_t rev = b.revision();
  b.set_cursor_position(1);
  b.insert_text("\nb");
  assert(b.revision() > rev);
  assert(b.line_count() == 2);
  assert(b.line(1) == "b");
  b.undo();
  assert(b.line_count() == 1);
}

int main() {
  test_inverse_law();
  test_redo_invalidation();
  test_contiguous_typing_groups();
  test_timeout_separates_groups();
  test_word_then_space_are_separate();
  test_redo_ends_typing_run();
  test_newlines_group();
  test_moving_away_starts_new_group();
  test_capacity();
  test_selection_replace_is_one_unit();
  test_word_navigation();
  test_bounds_are_no_ops();
  test_cursor_clamping();
  test_backspace_run();
  test_forward_delete_run();
  test_word_deletes();
  test_word_mode_deletes_selection();
  test_selection_queries();
  test_set_content_resets();
  test_replace_range();
  test_line_helpers();
  test_revision_and_lines_follow_edits();
  return 0;
}
