#include "input.hpp"

static constexpr int ESC = 27;

bool Input::consume_escape(int ch) {
  if (ch == ESC && !pending_meta_) {
    pending_meta_ = true;
    return true;
  }
  return false;
}

bool Input::take_meta() {
  bool m = pending_meta_;
  pending_meta_ = false;
  return m;
}

void Input::reset() {
  pending_meta_ = false;
}
