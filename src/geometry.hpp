#pragma once
/*
 * Geometry
 *
 * Purpose: immutable cell-grid value types (Point/Size/Rect).
 * Note: arithmetic returns new values; mutable_copy() is the escape hatch for
 *       hot loops that need to bump fields in place.
 */
#include <functional>
#include <utility>

class Point;
class Size;

struct MutablePoint {
  int x = 0;
  int y = 0;
  Point freeze() const;
};

struct MutableSize {
  int width = 0;
  int height = 0;
  Size freeze() const;
};

class Point {
public:
  constexpr Point() = default;
  constexpr Point(int x, int y) : x_(x), y_(y) {}
  static constexpr Point zero() { return Point(); }

  int x() const { return x_; }
  int y() const { return y_; }

  Point offset(int dx, int dy) const { return Point(x_ + dx, y_ + dy); }
  Point offset(const Point& d) const { return Point(x_ + d.x_, y_ + d.y_); }
  MutablePoint mutable_copy() const { return MutablePoint{x_, y_}; }

  bool operator==(const Point& other) const = default;

private:
  int x_ = 0;
  int y_ = 0;
};

class Size {
public:
  constexpr Size() = default;
  constexpr Size(int width, int height) : width_(width), height_(height) {}
  static constexpr Size zero() { return Size(); }

  int width() const { return width_; }
  int height() const { return height_; }
  bool is_empty() const { return width_ <= 0 || height_ <= 0; }

  Size grow(int dw, int dh) const { return Size(width_ + dw, height_ + dh); }
  // never goes below zero in either dimension
  Size shrink(int dw, int dh) const;
  Size max(const Size& other) const;
  MutableSize mutable_copy() const { return MutableSize{width_, height_}; }

  bool operator==(const Size& other) const = default;

private:
  int width_ = 0;
  int height_ = 0;
};

class Rect {
public:
  constexpr Rect() = default;
  constexpr Rect(Point origin, Size size) : origin_(origin), size_(size) {}
  constexpr Rect(int x, int y, int width, int height) : origin_(x, y), size_(width, height) {}
  static constexpr Rect zero() { return Rect(); }

  const Point& origin() const { return origin_; }
  const Size& size() const { return size_; }

  int min_x() const { return origin_.x(); }
  int max_x() const { return origin_.x() + size_.width(); }
  int min_y() const { return origin_.y(); }
  int max_y() const { return origin_.y() + size_.height(); }
  bool is_empty() const { return size_.is_empty(); }

  bool contains(const Point& pt) const;
  // empty (zero-size) rect when the two do not overlap
  Rect intersection(const Rect& other) const;
  void for_each_point(const std::function<void(const Point&)>& fn) const;

  Rect at(int x, int y) const { return Rect(Point(x, y), size_); }
  Rect at_x(int x) const { return Rect(Point(x, origin_.y()), size_); }
  Rect at_y(int y) const { return Rect(Point(origin_.x(), y), size_); }
  Rect with_size(int width, int height) const { return Rect(origin_, Size(width, height)); }
  Rect offset(int dx, int dy) const { return Rect(origin_.offset(dx, dy), size_); }

  bool operator==(const Rect& other) const = default;

private:
  Point origin_;
  Size size_;
};

double interpolate(double value, std::pair<double, double> from, std::pair<double, double> to);
