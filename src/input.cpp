#include "input.hpp"
#include <ncurses.h>

static std::optional<KeyEvent> special_key(int ch) {
  KeyEvent ev;
  switch (ch) {
    case KEY_UP: ev.key = Key::Up; break;
    case KEY_DOWN: ev.key = Key::Down; break;
    case KEY_LEFT: ev.key = Key::Left; break;
    case KEY_RIGHT: ev.key = Key::Right; break;
    case KEY_HOME: ev.key = Key::Home; break;
    case KEY_END: ev.key = Key::End; break;
    case KEY_PPAGE: ev.key = Key::PageUp; break;
    case KEY_NPAGE: ev.key = Key::PageDown; break;
    case KEY_DC: ev.key = Key::Delete; break;
    case KEY_BACKSPACE: ev.key = Key::Backspace; break;
    case KEY_ENTER: ev.key = Key::Enter; break;
    case KEY_BTAB: ev.key = Key::Tab; ev.shift = true; break;
    case KEY_SR: ev.key = Key::Up; ev.shift = true; break;
    case KEY_SF: ev.key = Key::Down; ev.shift = true; break;
    case KEY_SLEFT: ev.key = Key::Left; ev.shift = true; break;
    case KEY_SRIGHT: ev.key = Key::Right; ev.shift = true; break;
    default:
      if (ch >= KEY_F(1) && ch <= KEY_F(12)) {
        ev.key = static_cast<Key>(static_cast<int>(Key::F1) + (ch - KEY_F(1)));
        break;
      }
      return std::nullopt;
  }
  return ev;
}

std::optional<KeyEvent> Input::consume(int ch) {
  if (ch < 0) return std::nullopt;
  if (ch > 0xFF) {
    reset();
    if (auto ev = special_key(ch)) return ev;
    return KeyEvent{Key::Unknown, {}, false, false, false};
  }

  unsigned char c = static_cast<unsigned char>(ch);
  if (utf8_expected_ > 0) {
    if ((c & 0xC0) != 0x80) { reset(); return consume(ch); }
    utf8_.push_back(static_cast<char>(c));
    if (--utf8_expected_ > 0) return std::nullopt;
    KeyEvent ev{Key::Char, utf8_, false, false, false};
    utf8_.clear();
    return ev;
  }
  if (c >= 0xC0) {
    utf8_.assign(1, static_cast<char>(c));
    utf8_expected_ = c >= 0xF0 ? 3 : c >= 0xE0 ? 2 : 1;
    return std::nullopt;
  }

  KeyEvent ev;
  switch (c) {
    case 27: ev.key = Key::Escape; return ev;
    case '\t': ev.key = Key::Tab; return ev;
    case '\n':
    case '\r': ev.key = Key::Enter; return ev;
    case 127:
    case 8: ev.key = Key::Backspace; return ev;
    default: break;
  }
  if (c < 0x20) {
    // ^A..^Z
    ev.key = Key::Char;
    ev.ctrl = true;
    ev.text = std::string(1, static_cast<char>('a' + c - 1));
    return ev;
  }
  ev.key = Key::Char;
  ev.text = std::string(1, static_cast<char>(c));
  return ev;
}

void Input::reset() {
  utf8_.clear();
  utf8_expected_ = 0;
}
