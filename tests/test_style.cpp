#include "style.hpp"
#include "theme.hpp"
#include <cassert>

int main() {
  Style base;
  base.foreground = 2;

  Style bold = Style::from_sgr("\x1b[1m", base);
  assert(bold.is_bold());
  assert(bold.fg() == 2);

  Style off = Style::from_sgr("\x1b[22m", bold);
  assert(!off.is_bold());

  Style reset = Style::from_sgr("\x1b[0m", Style::from_sgr("\x1b[4;31m", base), base);
  assert(reset == base);

  Style colours = Style::from_sgr("\x1b[38;5;200;48;5;17m", Style());
  assert(colours.fg() == 200);
  assert(colours.bg() == 17);

  // overlong parameters saturate; out-of-palette indices leave the colour alone
  Style huge = Style::from_sgr("\x1b[38;5;99999999999;1m", base);
  assert(huge.fg() == 2);
  assert(huge.is_bold());
  Style wide_bg = Style::from_sgr("\x1b[48;5;256;38;5;255m", Style());
  assert(!wide_bg.background);
  assert(wide_bg.fg() == 255);
  assert(Style::from_sgr("\x1b[4000000000000000000000m", base) == base);

  Style bright = Style::from_sgr("\x1b[93;104m", Style());
  assert(bright.fg() == 11);
  assert(bright.bg() == 12);

  assert(Style::from_sgr("\x1b[39m", bright, base).fg() == 2);
  assert(Style::from_sgr("plain", base) == base);
  assert(Style::is_sgr("\x1b[m"));
  assert(!Style::is_sgr("[1m"));

  // encoded pen reads back the same
  Style pen;
  pen.bold = true;
  pen.underline = true;
  pen.foreground = 4;
  pen.background = 100;
  assert(Style::from_sgr(pen.to_sgr(), Style()) == pen);

  Style local;
  local.bold = true;
  Style merged = base.merge(local);
  assert(merged.fg() == 2 && merged.is_bold());
  assert(base.merge(Style()) == base);

  const Theme& t = Theme::plain();
  assert(t.ui(ThemeState{false, true}) != t.ui());
  assert(t.ui(ThemeState{true, false}).is_inverse());
  return 0;
}
