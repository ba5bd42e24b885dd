#include "theme.hpp"

static Style make_style(int fg, int bg) {
  Style s;
  if (fg != kDefaultColor) s.foreground = fg;
  if (bg != kDefaultColor) s.background = bg;
  return s;
}

const Theme& Theme::plain() {
  static const Theme theme(Style(), make_style(kDefaultColor, 8), make_style(15, 8), [] {
    Style s; s.inverse = true; return s;
  }());
  return theme;
}

const Theme& Theme::primary() {
  static const Theme theme(make_style(12, kDefaultColor), make_style(15, 4), make_style(15, 12), make_style(4, 15));
  return theme;
}

const Theme& Theme::selected() {
  static const Theme theme(make_style(0, 11), make_style(0, 3), make_style(0, 11), make_style(3, 0));
  return theme;
}

Style Theme::text(ThemeState state) const {
  Style s = text_;
  if (state.is_hover) s = s.merge(Style{.underline = true});
  if (state.is_pressed) s = s.merge(pressed_);
  return s;
}

Style Theme::ui(ThemeState state) const {
  if (state.is_pressed) return ui_.merge(pressed_);
  if (state.is_hover) return ui_.merge(hover_);
  return ui_;
}
