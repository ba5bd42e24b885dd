#include "input.hpp"
#include <cassert>
#include <ncurses.h>

int main() {
  Input in;

  auto a = in.consume('a');
  assert(a && a->key == Key::Char && a->text == "a");

  auto ctrl_c = in.consume(3);
  assert(ctrl_c && ctrl_c->ctrl && ctrl_c->text == "c");

  assert(in.consume(27)->key == Key::Escape);
  assert(in.consume('\r')->key == Key::Enter);
  assert(in.consume(127)->key == Key::Backspace);
  assert(in.consume(KEY_UP)->key == Key::Up);
  assert(in.consume(KEY_F(3))->key == Key::F3);
  auto shifted = in.consume(KEY_SRIGHT);
  assert(shifted->key == Key::Right && shifted->shift);

  // "é" arrives one byte at a time
  assert(!in.consume(0xC3));
  assert(in.pending());
  auto e = in.consume(0xA9);
  assert(e && e->text == "\xc3\xa9");
  assert(!in.pending());

  // a broken sequence is dropped and the new byte is read on its own
  assert(!in.consume(0xE6));
  auto x = in.consume('x');
  assert(x && x->text == "x");
  assert(!in.pending());

  assert(!in.consume(-1));
  return 0;
}
