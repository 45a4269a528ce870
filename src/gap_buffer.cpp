#include "gap_buffer.hpp"
#include <algorithm>

void GapBuffer::clear() { buf.clear(); gap_start = gap_end = 0; }

size_t GapBuffer::length() const { return buf.size() - (gap_end - gap_start); }

void GapBuffer::assign(std::string_view text) {
  buf.assign(text.begin(), text.end());
  gap_start = gap_end = buf.size();
}

void GapBuffer::ensure_gap(size_t need) {
  size_t avail = gap_size();
  if (avail >= need) return;
  size_t grow = need - avail;
  size_t new_size = buf.size() + grow + grow;
  std::vector<char> nb;
  nb.resize(new_size);
  size_t left = gap_start;
  std::copy(buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(left), nb.begin());
  size_t nge = left + avail + grow + grow;
  std::copy(buf.begin() + static_cast<std::ptrdiff_t>(gap_end), buf.end(),
            nb.begin() + static_cast<std::ptrdiff_t>(nge));
  buf.swap(nb);
  gap_end = nge;
}

void GapBuffer::move_gap_to(size_t pos) {
  if (pos == gap_start) return;
  if (pos < gap_start) {
    size_t delta = gap_start - pos;
    for (size_t i = 0; i < delta; ++i) buf[gap_end - 1 - i] = buf[gap_start - 1 - i];
    gap_start -= delta; gap_end -= delta;
  } else {
    size_t delta = pos - gap_start;
    for (size_t i = 0; i < delta; ++i) buf[gap_start + i] = buf[gap_end + i];
    gap_start += delta; gap_end += delta;
  }
}

void GapBuffer::insert_at(size_t pos, std::string_view text) {
  if (text.empty()) return;
  pos = std::min(pos, length());
  move_gap_to(pos);
  ensure_gap(text.size());
  std::copy(text.begin(), text.end(), buf.begin() + static_cast<std::ptrdiff_t>(gap_start));
  gap_start += text.size();
}

void GapBuffer::erase_range(size_t pos, size_t len) {
  size_t total = length();
  if (pos >= total || len == 0) return;
  len = std::min(len, total - pos);
  move_gap_to(pos);
  gap_end += len;
}

char GapBuffer::at(size_t pos) const {
  if (pos >= length()) return '\0';
  return pos < gap_start ? buf[pos] : buf[pos + gap_size()];
}

std::string GapBuffer::slice(size_t pos, size_t len) const {
  size_t total = length();
  if (pos >= total) return std::string();
  len = std::min(len, total - pos);
  std::string out; out.reserve(len);
  size_t end = pos + len;
  if (pos < gap_start) {
    size_t left_end = std::min(end, gap_start);
    out.append(buf.data() + pos, left_end - pos);
  }
  if (end > gap_start) {
    size_t from = std::max(pos, gap_start);
    out.append(buf.data() + from + gap_size(), end - from);
  }
  return out;
}
