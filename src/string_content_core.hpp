#pragma once
#include <string>
#include <string_view>
#include <algorithm>
#include "i_text_content_core.hpp"

class StringContentCore : public TextContentCRTP<StringContentCore> {
public:
  static constexpr std::string_view get_name_sv() { return "string"; }

  void do_assign(std::string_view text) { text_.assign(text.data(), text.size()); }
  size_t do_length() const { return text_.size(); }
  char do_at(size_t i) const { return i < text_.size() ? text_[i] : '\0'; }
  std::string do_slice(size_t pos, size_t len) const {
    if (pos >= text_.size()) return std::string();
    return text_.substr(pos, len);
  }
  void do_insert(size_t pos, std::string_view text) {
    pos = std::min(pos, text_.size());
    text_.insert(pos, text.data(), text.size());
  }
  void do_erase(size_t pos, size_t len) {
    if (pos >= text_.size()) return;
    text_.erase(pos, len);
  }

private:
  std::string text_;
};
