#pragma once
/*
 * Theme
 *
 * Purpose: resolve a Style for a role (text / ui control) and interaction state.
 * Note: views look themes up through View::theme(), which walks to the nearest
 *       ancestor override and falls back to Theme::plain().
 */
#include "style.hpp"

struct ThemeState {
  bool is_pressed = false;
  bool is_hover = false;
};

class Theme {
public:
  Theme() = default;
  Theme(Style text, Style ui, Style hover, Style pressed)
    : text_(text), ui_(ui), hover_(hover), pressed_(pressed) {}

  static const Theme& plain();
  static const Theme& primary();
  static const Theme& selected();

  Style text(ThemeState state = {}) const;
  Style ui(ThemeState state = {}) const;

  bool operator==(const Theme& other) const = default;

private:
  Style text_;
  Style ui_;
  Style hover_;
  Style pressed_;
};
