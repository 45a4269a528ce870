#pragma once
/*
 * Input
 *
 * Purpose: fold terminal key codes into editor keys with minimal state.
 * Meta: terminals send Alt-x as ESC followed by x; the ESC is held here until the next key.
 */

class Input {
public:
  /*true when ch was swallowed as a meta prefix*/
  bool consume_escape(int ch);
  /*true (once) if the key following a prefix should be read as Alt-key*/
  bool take_meta();
  void reset();
private:
  bool pending_meta_ = false;
};
