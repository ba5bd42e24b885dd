#include "geometry.hpp"
#include <algorithm>

Point MutablePoint::freeze() const { return Point(x, y); }
Size MutableSize::freeze() const { return Size(width, height); }

Size Size::shrink(int dw, int dh) const {
  return Size(std::max(0, width_ - dw), std::max(0, height_ - dh));
}

Size Size::max(const Size& other) const {
  return Size(std::max(width_, other.width_), std::max(height_, other.height_));
}

bool Rect::contains(const Point& pt) const {
  return pt.x() >= min_x() && pt.x() < max_x() && pt.y() >= min_y() && pt.y() < max_y();
}

Rect Rect::intersection(const Rect& other) const {
  int x0 = std::max(min_x(), other.min_x());
  int y0 = std::max(min_y(), other.min_y());
  int x1 = std::min(max_x(), other.max_x());
  int y1 = std::min(max_y(), other.max_y());
  if (x1 <= x0 || y1 <= y0) return Rect(Point(x0, y0), Size::zero());
  return Rect(x0, y0, x1 - x0, y1 - y0);
}

void Rect::for_each_point(const std::function<void(const Point&)>& fn) const {
  for (int y = min_y(); y < max_y(); ++y) {
    for (int x = min_x(); x < max_x(); ++x) fn(Point(x, y));
  }
}

double interpolate(double value, std::pair<double, double> from, std::pair<double, double> to) {
  double span = from.second - from.first;
  if (span == 0) return to.first;
  double t = (value - from.first) / span;
  return to.first + t * (to.second - to.first);
}
