#pragma once
/*
 * View
 *
 * Purpose: base of every node in the UI tree; owns the sizing protocol.
 * Design: natural_size()/render() are non-virtual wrappers that apply the
 *         explicit width/height, min/max, padding and offset props, memoize per
 *         available size, and detect viewport size changes. Subclasses only
 *         implement do_natural_size()/do_render().
 * Ownership: parent_ is a non-owning back pointer set by Container::add and
 *            cleared by Container::remove.
 */
#include <map>
#include <optional>
#include <utility>
#include "events.hpp"
#include "geometry.hpp"
#include "theme.hpp"

class Viewport;
class Screen;
class Container;

class Dimension {
public:
  enum class Mode { Unset, Fixed, Fill, Natural };

  Dimension() = default;
  Dimension(int value) : mode_(Mode::Fixed), value_(value) {}
  static Dimension fill() { Dimension d; d.mode_ = Mode::Fill; return d; }
  static Dimension natural() { Dimension d; d.mode_ = Mode::Natural; return d; }

  Mode mode() const { return mode_; }
  bool is_set() const { return mode_ != Mode::Unset; }
  int value() const { return value_; }

  template <class NaturalFn>
  int resolve(int available, NaturalFn natural) const {
    if (mode_ == Mode::Fill) return available;
    if (mode_ == Mode::Natural) return natural();
    return value_;
  }

  bool operator==(const Dimension& other) const = default;

private:
  Mode mode_ = Mode::Unset;
  int value_ = 0;
};

struct Edges {
  int top = 0;
  int right = 0;
  int bottom = 0;
  int left = 0;
  static Edges all(int n) { return Edges{n, n, n, n}; }
  int horizontal() const { return left + right; }
  int vertical() const { return top + bottom; }
};

struct ViewProps {
  std::optional<Theme> theme;
  std::optional<int> x;
  std::optional<int> y;
  Dimension width;
  Dimension height;
  std::optional<int> min_width;
  std::optional<int> min_height;
  std::optional<int> max_width;
  std::optional<int> max_height;
  std::optional<Edges> padding;
  bool debug = false;
};

class View {
public:
  explicit View(ViewProps props = {});
  virtual ~View() = default;
  View(const View&) = delete;
  View& operator=(const View&) = delete;

  // Size this view wants inside `available`, explicit props applied.
  Size natural_size(Size available);
  // Resolve the actual size inside viewport.content_size() and paint.
  void render(Viewport& viewport);

  // Drop every cached size; also the parent's unless suppressed internally.
  void invalidate_size();
  virtual void update(ViewProps props);

  virtual void receive_key(const KeyEvent&) {}
  virtual void receive_mouse(const MouseEvent&) {}
  // return true to keep receiving ticks
  virtual bool receive_tick(double) { return false; }

  virtual void will_move_to(View*) {}
  virtual void did_move_from(View*) {}
  virtual void did_mount(Screen&) {}
  virtual void did_unmount(Screen&) {}
  virtual void move_to_screen(Screen* screen);

  View* parent() const { return parent_; }
  Screen* screen() const { return screen_; }
  const Theme& theme() const;
  void set_theme(std::optional<Theme> theme) { props_.theme = std::move(theme); }
  const ViewProps& props() const { return props_; }
  bool debug() const;

  // size resolved by the last render
  const Size& content_size() const { return rendered_content_size_; }
  bool contains_local(const Point& pt) const { return Rect(Point::zero(), rendered_content_size_).contains(pt); }
  size_t cached_size_count() const { return size_cache_.size(); }
  virtual const char* type_name() const { return "View"; }

protected:
  virtual Size do_natural_size(Size available) = 0;
  virtual void do_render(Viewport& viewport) = 0;

private:
  friend class Container;

  enum class Prefer { Grow, Shrink };

  template <class CalcFn>
  Size restrict_size(CalcFn calc_size, Size available, Prefer prefer) const;
  void invalidate_self_only();

  ViewProps props_;
  View* parent_ = nullptr;
  Screen* screen_ = nullptr;

  std::map<std::pair<int, int>, Size> size_cache_;
  Size viewport_content_size_;
  Size rendered_content_size_;
  bool invalidate_parent_ = true;
  bool in_natural_size_ = false;
  bool in_render_ = false;
};
