#include "headless_terminal.hpp"
#include <algorithm>

HeadlessTerminal::HeadlessTerminal(int rows, int cols)
  : rows_(rows), cols_(cols),
    grid_(static_cast<size_t>(rows), std::string(static_cast<size_t>(cols), ' ')),
    reverse_(static_cast<size_t>(rows), std::vector<bool>(static_cast<size_t>(cols), false)) {}

void HeadlessTerminal::clear() {
  for (auto& r : grid_) std::fill(r.begin(), r.end(), ' ');
  for (auto& r : reverse_) std::fill(r.begin(), r.end(), false);
}

void HeadlessTerminal::put(int row, int col, const std::string& text, bool reverse) {
  if (row < 0 || row >= rows_) return;
  for (size_t i = 0; i < text.size(); ++i) {
    int c = col + static_cast<int>(i);
    if (c < 0) continue;
    if (c >= cols_) break;
    grid_[row][c] = text[i];
    reverse_[row][c] = reverse;
  }
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) { put(row, col, text, false); }

void HeadlessTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  int len = static_cast<int>(text.size());
  hl_start = std::clamp(hl_start, 0, len);
  int hl_end = std::clamp(hl_start + std::max(0, hl_len), hl_start, len);
  put(row, col, text.substr(0, hl_start), false);
  put(row, col + hl_start, text.substr(hl_start, hl_end - hl_start), true);
  put(row, col + hl_end, text.substr(hl_end), false);
}

void HeadlessTerminal::draw_colored(int row, int col, const std::string& text, int) { put(row, col, text, false); }

std::string HeadlessTerminal::row_text(int row) const {
  if (row < 0 || row >= rows_) return std::string();
  std::string s = grid_[row];
  size_t end = s.find_last_not_of(' ');
  return end == std::string::npos ? std::string() : s.substr(0, end + 1);
}

bool HeadlessTerminal::is_highlighted(int row, int col) const {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return false;
  return reverse_[row][col];
}
