#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around ncurses init/teardown.
 * Usage: construct in main before NcursesTerminal; destructor restores terminal.
 * Note: manages terminal modes (raw/noecho/keypad/mouse), not rendering.
 */

class Terminal {
public:
  explicit Terminal(bool enable_mouse);
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;

private:
  bool mouse_ = false;
};
