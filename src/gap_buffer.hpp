#pragma once
#include <vector>
#include <string>
#include <string_view>

class GapBuffer {
public:
  std::vector<char> buf;
  size_t gap_start = 0;
  size_t gap_end = 0;

  void clear();
  size_t length() const;
  size_t gap_size() const { return gap_end - gap_start; }
  void assign(std::string_view text);
  void move_gap_to(size_t pos);
  void ensure_gap(size_t need);
  void insert_at(size_t pos, std::string_view text);
  void erase_range(size_t pos, size_t len);
  char at(size_t pos) const;
  std::string slice(size_t pos, size_t len) const;
};
