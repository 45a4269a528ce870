#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around ncurses init/teardown.
 * Usage: construct in main before any NcursesTerminal; destructor restores terminal.
 * Note: raw mode so Ctrl-S/Ctrl-Q/Ctrl-Z/Ctrl-C reach the editor as keys.
 */

class Terminal {
public:
  Terminal();
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;
};
