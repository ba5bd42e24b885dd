#include "ncurses_terminal.hpp"
#include <ncurses.h>

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    use_default_colors();
    colors_ = true;
  }
}

TermSize NcursesTerminal::get_size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear_screen() { werase(stdscr); }

int NcursesTerminal::pair_for(int fg, int bg) {
  if (!colors_) return 0;
  if (fg >= COLORS) fg %= 8;
  if (bg >= COLORS) bg %= 8;
  if (fg < 0 && bg < 0) return 0;
  auto key = std::make_pair(fg, bg);
  auto it = pairs_.find(key);
  if (it != pairs_.end()) return it->second;
  // out of pairs: fall back to the default pair rather than recycling
  if (next_pair_ >= COLOR_PAIRS) return 0;
  int id = next_pair_++;
  init_pair(static_cast<short>(id), static_cast<short>(fg), static_cast<short>(bg));
  pairs_.emplace(key, id);
  return id;
}

void NcursesTerminal::draw_cell(int row, int col, const std::string& glyph, const Style& style) {
  if (glyph.empty()) return; // continuation of a wide glyph
  attr_t attrs = A_NORMAL;
  if (style.is_bold()) attrs |= A_BOLD;
  if (style.is_dim()) attrs |= A_DIM;
  if (style.is_italic()) attrs |= A_ITALIC;
  if (style.is_underline()) attrs |= A_UNDERLINE;
  if (style.is_inverse()) attrs |= A_REVERSE;
  int pair = pair_for(style.fg(), style.bg());
  wattr_set(stdscr, attrs, static_cast<short>(pair), nullptr);
  mvwaddstr(stdscr, row, col, glyph.c_str());
  wattr_set(stdscr, A_NORMAL, 0, nullptr);
}

void NcursesTerminal::flush() { wrefresh(stdscr); }

static std::optional<MouseEvent> decode_mouse(const MEVENT& me) {
  MouseEvent ev;
  ev.position = Point(me.x, me.y);
  mmask_t b = me.bstate;
  if (b & BUTTON1_PRESSED) { ev.action = MouseAction::Press; ev.button = MouseButton::Left; }
  else if (b & BUTTON1_RELEASED) { ev.action = MouseAction::Release; ev.button = MouseButton::Left; }
  else if (b & BUTTON2_PRESSED) { ev.action = MouseAction::Press; ev.button = MouseButton::Middle; }
  else if (b & BUTTON2_RELEASED) { ev.action = MouseAction::Release; ev.button = MouseButton::Middle; }
  else if (b & BUTTON3_PRESSED) { ev.action = MouseAction::Press; ev.button = MouseButton::Right; }
  else if (b & BUTTON3_RELEASED) { ev.action = MouseAction::Release; ev.button = MouseButton::Right; }
  else if (b & BUTTON4_PRESSED) { ev.action = MouseAction::WheelUp; }
#ifdef BUTTON5_PRESSED
  else if (b & BUTTON5_PRESSED) { ev.action = MouseAction::WheelDown; }
#endif
  else if (b & REPORT_MOUSE_POSITION) { ev.action = MouseAction::Move; }
  else return std::nullopt;
  return ev;
}

std::optional<InputEvent> NcursesTerminal::read_event(int timeout_ms) {
  wtimeout(stdscr, timeout_ms);
  while (true) {
    int ch = wgetch(stdscr);
    if (ch == ERR) { input_.reset(); return std::nullopt; }
    if (ch == KEY_RESIZE) return ResizeEvent{Size(COLS, LINES)};
    if (ch == KEY_MOUSE) {
      MEVENT me;
      if (getmouse(&me) != OK) continue;
      if (auto ev = decode_mouse(me)) return *ev;
      continue;
    }
    if (auto key = input_.consume(ch)) return *key;
  }
}
