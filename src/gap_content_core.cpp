#include "gap_content_core.hpp"

void GapContentCore::do_assign(std::string_view text) { gb.assign(text); }

size_t GapContentCore::do_length() const { return gb.length(); }

char GapContentCore::do_at(size_t i) const { return gb.at(i); }

std::string GapContentCore::do_slice(size_t pos, size_t len) const { return gb.slice(pos, len); }

void GapContentCore::do_insert(size_t pos, std::string_view text) { gb.insert_at(pos, text); }

void GapContentCore::do_erase(size_t pos, size_t len) { gb.erase_range(pos, len); }
