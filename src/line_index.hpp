#pragma once
#include <vector>
#include <cstddef>
#include "text_content.hpp"

/*
  offsets of line starts in a flat document.
  line r spans [line_start(r), line_end(r)), line_end excludes the '\n'.
*/
class LineIndex {
public:
  void rebuild(const TextContent& content);
  size_t line_count() const;
  size_t line_start(size_t row) const;
  size_t line_end(size_t row, size_t content_length) const;
  size_t row_of(size_t offset) const;

private:
  std::vector<size_t> starts_{0};
};
