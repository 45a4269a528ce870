#include "line_index.hpp"
#include <algorithm>

void LineIndex::rebuild(const TextContent& content) {
  starts_.clear();
  starts_.push_back(0);
  size_t len = content.length();
  for (size_t i = 0; i < len; ++i) {
    if (content.at(i) == '\n') starts_.push_back(i + 1);
  }
}

size_t LineIndex::line_count() const { return starts_.size(); }

size_t LineIndex::line_start(size_t row) const {
  if (row >= starts_.size()) return starts_.back();
  return starts_[row];
}

size_t LineIndex::line_end(size_t row, size_t content_length) const {
  if (row + 1 < starts_.size()) return starts_[row + 1] - 1;
  return content_length;
}

size_t LineIndex::row_of(size_t offset) const {
  auto it = std::upper_bound(starts_.begin(), starts_.end(), offset);
  return static_cast<size_t>(it - starts_.begin()) - 1;
}
