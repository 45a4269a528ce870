#pragma once
#include <string>
#include <string_view>
#include "i_text_content_core.hpp"
#include "gap_buffer.hpp"

/*
  gap buffer backend: cheap repeated edits around one point (the cursor),
  which is how typing and backspacing hit the document.
*/
class GapContentCore : public TextContentCRTP<GapContentCore> {
public:
  GapBuffer gb;
  static constexpr std::string_view get_name_sv() { return "gap"; }

  /*forward to CRTP impl*/
  void do_assign(std::string_view text);
  size_t do_length() const;
  char do_at(size_t i) const;
  std::string do_slice(size_t pos, size_t len) const;
  void do_insert(size_t pos, std::string_view text);
  void do_erase(size_t pos, size_t len);
};
