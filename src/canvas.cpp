#include "canvas.hpp"
#include <algorithm>
#include <stdexcept>

void Canvas::resize(Size size) {
  size_ = Size(std::max(0, size.width()), std::max(0, size.height()));
  cells_.assign(static_cast<size_t>(size_.width()) * size_.height(), Cell{});
}

void Canvas::clear(const Style& style) {
  for (auto& c : cells_) { c.glyph = " "; c.style = style; }
}

void Canvas::set(const Point& pt, const std::string& glyph, const Style& style, int width) {
  if (!Rect(Point::zero(), size_).contains(pt)) return;
  const size_t row = static_cast<size_t>(pt.y()) * size_.width();
  const int end = std::min(size_.width(), pt.x() + std::max(1, width));

  // overwriting half of a wide glyph blanks the other half
  if (cells_[row + pt.x()].glyph.empty()) {
    for (int x = pt.x() - 1; x >= 0; --x) {
      Cell& lead = cells_[row + x];
      bool was_lead = !lead.glyph.empty();
      lead.glyph = " ";
      if (was_lead) break;
    }
  }
  for (int x = end; x < size_.width() && cells_[row + x].glyph.empty(); ++x) cells_[row + x].glyph = " ";

  Cell& c = cells_[row + pt.x()];
  c.glyph = glyph;
  c.style = style;
  for (int x = pt.x() + 1; x < end; ++x) {
    Cell& cont = cells_[row + x];
    cont.glyph.clear();
    cont.style = style;
  }
}

const Cell& Canvas::at(int x, int y) const {
  if (!Rect(Point::zero(), size_).contains(Point(x, y))) throw std::out_of_range("Canvas::at");
  return cells_[static_cast<size_t>(y) * size_.width() + x];
}

std::string Canvas::row_text(int y) const {
  std::string out;
  for (int x = 0; x < size_.width(); ++x) out += at(x, y).glyph;
  return out;
}
