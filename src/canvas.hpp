#pragma once
/*
 * Canvas
 *
 * Purpose: the cell grid a render pass paints into; flushed to an ITerminal.
 * Note: a wide glyph occupies its cell plus a continuation cell (empty glyph).
 */
#include <string>
#include <vector>
#include "geometry.hpp"
#include "style.hpp"

struct Cell {
  std::string glyph = " ";
  Style style;
  bool operator==(const Cell& other) const = default;
};

class Canvas {
public:
  Canvas() = default;
  explicit Canvas(Size size) { resize(size); }

  void resize(Size size);
  void clear(const Style& style = Style());
  const Size& size() const { return size_; }

  // out-of-range writes are ignored
  void set(const Point& pt, const std::string& glyph, const Style& style, int width = 1);
  const Cell& at(int x, int y) const;
  // glyphs of one row, continuation cells skipped
  std::string row_text(int y) const;

private:
  Size size_;
  std::vector<Cell> cells_;
};
