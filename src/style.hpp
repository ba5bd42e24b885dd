#pragma once
/*
 * Style
 *
 * Purpose: the pen value written with each cell (colours + attributes).
 * Design: every field is optional; merge() lets the local style override only
 *         what it sets. from_sgr() is the codec for inline ESC[...m tokens.
 */
#include <optional>
#include <string>
#include <string_view>

// -1 is the terminal default; 0-7 standard, 8-15 bright, 16-255 xterm palette
constexpr int kDefaultColor = -1;

struct Style {
  std::optional<int> foreground;
  std::optional<int> background;
  std::optional<bool> bold;
  std::optional<bool> dim;
  std::optional<bool> italic;
  std::optional<bool> underline;
  std::optional<bool> inverse;
  std::optional<bool> strikeout;

  Style merge(const Style& local) const;

  // Apply one SGR token (ESC [ params m) on top of `current`. Parameter 0
  // resets to `reset`. Unknown parameters are ignored.
  static Style from_sgr(std::string_view token, const Style& current, const Style& reset = Style());
  static bool is_sgr(std::string_view token);

  int fg() const { return foreground.value_or(kDefaultColor); }
  int bg() const { return background.value_or(kDefaultColor); }
  bool is_bold() const { return bold.value_or(false); }
  bool is_dim() const { return dim.value_or(false); }
  bool is_italic() const { return italic.value_or(false); }
  bool is_underline() const { return underline.value_or(false); }
  bool is_inverse() const { return inverse.value_or(false); }
  bool is_strikeout() const { return strikeout.value_or(false); }

  std::string to_sgr() const;

  bool operator==(const Style& other) const = default;
};
