#include "renderer.hpp"
#include <algorithm>
#include <string>

static int digits_of(size_t n) {
  int d = 1;
  while (n >= 10) { n /= 10; d++; }
  return d;
}

static void scroll_into_view(Viewport& vp, int row, int col, int text_rows, int text_cols) {
  if (row < vp.top_line) vp.top_line = row;
  if (text_rows > 0 && row >= vp.top_line + text_rows) vp.top_line = row - text_rows + 1;
  if (col < vp.left_col) vp.left_col = col;
  if (text_cols > 0 && col >= vp.left_col + text_cols) vp.left_col = col - text_cols + 1;
  vp.top_line = std::max(0, vp.top_line);
  vp.left_col = std::max(0, vp.left_col);
}

std::string Renderer::status_line(const RenderView& view) {
  const TextBuffer& buf = *view.buf;
  std::string name = view.file_path ? view.file_path->filename().string() : std::string("[No Name]");
  std::string s = " " + name;
  if (view.modified) s += " [+]";
  s += "  Ln " + std::to_string(buf.cursor_row() + 1) + ", Col " + std::to_string(buf.cursor_col() + 1);
  if (auto sel = buf.selection_range()) s += "  (" + std::to_string(sel->end - sel->start) + " selected)";
  s += buf.can_undo() ? "  undo" : "  -";
  s += buf.can_redo() ? " redo" : " -";
  if (!view.message.empty()) s += "  | " + view.message;
  return s;
}

void Renderer::render(ITerminal& term, const RenderView& view) {
  const TextBuffer& buf = *view.buf;
  Viewport& vp = *view.vp;
  TermSize sz = term.get_size();
  int rows = sz.rows, cols = sz.cols;
  term.clear();
  int text_rows = std::max(0, rows - 1);
  int gutter = view.show_line_numbers ? digits_of(buf.line_count()) + 1 : 0;
  int text_cols = std::max(0, cols - gutter);

  int cur_row = static_cast<int>(buf.cursor_row());
  int cur_col = static_cast<int>(buf.cursor_col());
  scroll_into_view(vp, cur_row, cur_col, text_rows, text_cols);

  auto sel = buf.selection_range();
  int total = static_cast<int>(buf.line_count());
  for (int i = 0; i < text_rows; ++i) {
    int r = vp.top_line + i;
    if (r >= total) {
      term.draw_colored(i, 0, "~", kColorGutter);
      continue;
    }
    if (gutter > 0) {
      std::string num = std::to_string(r + 1);
      num = std::string(static_cast<size_t>(gutter - 1) - num.size(), ' ') + num + " ";
      term.draw_colored(i, 0, num, kColorGutter);
    }
    std::string text = buf.line(static_cast<size_t>(r));
    std::string visible = vp.left_col < static_cast<int>(text.size())
      ? text.substr(static_cast<size_t>(vp.left_col), static_cast<size_t>(text_cols))
      : std::string();
    if (!sel) {
      term.draw_text(i, gutter, visible);
      continue;
    }
    // selection in line-local columns; a selected '\n' shows as one reversed cell
    size_t ls = buf.line_start(static_cast<size_t>(r));
    size_t le = buf.line_end(static_cast<size_t>(r));
    size_t s = std::max(sel->start, ls);
    size_t e = std::min(sel->end, le + 1);
    if (s >= e) {
      term.draw_text(i, gutter, visible);
      continue;
    }
    int hl_start = static_cast<int>(s - ls) - vp.left_col;
    int hl_end = static_cast<int>(e - ls) - vp.left_col;
    if (e > le && static_cast<int>(visible.size()) < text_cols) visible.push_back(' ');
    term.draw_highlighted(i, gutter, visible, std::max(0, hl_start), hl_end - std::max(0, hl_start));
  }

  if (rows > 0) {
    std::string status = status_line(view);
    if (static_cast<int>(status.size()) > cols) status.resize(static_cast<size_t>(cols));
    status.append(static_cast<size_t>(cols) - status.size(), ' ');
    term.draw_highlighted(rows - 1, 0, status, 0, cols);
  }
  term.move_cursor(cur_row - vp.top_line, gutter + cur_col - vp.left_col);
  term.refresh();
}
