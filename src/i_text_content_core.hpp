#pragma once
#include <string>
#include <string_view>
#include <concepts>
#include <cstddef>

/*
  flat character store used by TextBuffer.
  positions are offsets into the whole document; out-of-range positions are
  clamped by the backends, never rejected.
*/
template <typename Derived>
class TextContentCRTP {
public:
  static constexpr size_t npos = std::string::npos;

  std::string_view get_name() const { return Derived::get_name_sv(); }
  void assign(std::string_view text) { as_derived().do_assign(text); }
  size_t length() const { return as_const_derived().do_length(); }
  bool empty() const { return length() == 0; }
  char at(size_t i) const { return as_const_derived().do_at(i); }
  std::string slice(size_t pos, size_t len) const { return as_const_derived().do_slice(pos, len); }
  std::string str() const { return slice(0, length()); }
  /*insert*/
  void insert(size_t pos, std::string_view text) { as_derived().do_insert(pos, text); }
  /*erase*/
  void erase(size_t pos, size_t len) { as_derived().do_erase(pos, len); }

  /*first ch at or after from, npos if none*/
  size_t find(char ch, size_t from) const {
    size_t n = length();
    for (size_t i = from; i < n; ++i) if (at(i) == ch) return i;
    return npos;
  }
  /*last ch strictly before `before`, npos if none*/
  size_t rfind(char ch, size_t before) const {
    size_t i = before < length() ? before : length();
    while (i > 0) {
      --i;
      if (at(i) == ch) return i;
    }
    return npos;
  }

private:
  Derived& as_derived() { return static_cast<Derived&>(*this); }
  const Derived& as_const_derived() const { return static_cast<const Derived&>(*this); }
};

template <typename T>
concept TextContentCRTPConcept = std::derived_from<T, TextContentCRTP<T>> &&
  requires(T t, const T ct, std::string_view sv, size_t n) {
    { T::get_name_sv() } -> std::convertible_to<std::string_view>;
    t.do_assign(sv);
    { ct.do_length() } -> std::convertible_to<size_t>;
    { ct.do_at(n) } -> std::convertible_to<char>;
    { ct.do_slice(n, n) } -> std::convertible_to<std::string>;
    t.do_insert(n, sv);
    t.do_erase(n, n);
  };
