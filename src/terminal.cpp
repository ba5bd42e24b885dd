#include "terminal.hpp"
#include <ncurses.h>
#include <locale.h>
#include <cstdio>

// any-event mouse tracking, so motion without a button is reported too
static const char* kMouseMotionOn = "\033[?1003h";
static const char* kMouseMotionOff = "\033[?1003l";

Terminal::Terminal(bool enable_mouse) : mouse_(enable_mouse) {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  curs_set(0);
  ESCDELAY = 25;
  if (mouse_) {
    mousemask(ALL_MOUSE_EVENTS | REPORT_MOUSE_POSITION, nullptr);
    mouseinterval(0);
    std::printf("%s", kMouseMotionOn);
    std::fflush(stdout);
  }
}

Terminal::~Terminal() {
  if (mouse_) {
    std::printf("%s", kMouseMotionOff);
    std::fflush(stdout);
  }
  endwin();
}
