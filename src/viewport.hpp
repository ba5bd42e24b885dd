#pragma once
/*
 * Viewport
 *
 * Purpose: per-render coordinate/clip/pen context handed to View::render.
 * Coordinates: every Point a view passes in is local to the viewport's
 *   content origin; visible_rect() is the clipped part of
 *   Rect(0, 0, content_size) that actually reaches the canvas.
 * Lifetime: created by the render pass (Screen::render) on the stack; nested
 *   viewports live only for the duration of clipped()/render_view() bodies.
 */
#include <functional>
#include <optional>
#include <string_view>
#include <vector>
#include "canvas.hpp"
#include "events.hpp"
#include "geometry.hpp"
#include "style.hpp"

class View;

struct MouseRegistration {
  View* view = nullptr;
  MouseInterests interests = 0;
  Rect visible;    // screen coordinates
  Point origin;    // screen coordinates of the view's content origin
  bool in_modal = false;
};

struct ModalRequest {
  View* view = nullptr;
  View* owner = nullptr;  // the view that asked for it
  std::function<void()> on_dismiss;
  Rect anchor;     // requesting view, screen coordinates
};

// Everything one render pass records besides the painted cells.
struct RenderFrame {
  explicit RenderFrame(Canvas& c) : canvas(c) {}
  Canvas& canvas;
  std::vector<MouseRegistration> mouse;
  std::vector<View*> ticks;
  std::optional<ModalRequest> modal;
  bool in_modal = false;
};

class Viewport;

class Pen {
public:
  void replace_pen(const Style& style);
  // apply an inline ESC[...m token on top of the current pen
  void apply_sgr(std::string_view token);
  const Style& style() const;

private:
  friend class Viewport;
  Pen(Viewport& viewport, Style initial) : viewport_(viewport), initial_(initial) {}
  Viewport& viewport_;
  Style initial_;
};

class Viewport {
public:
  using Body = std::function<void(Viewport&)>;

  // root viewport covering the whole canvas
  Viewport(RenderFrame& frame, Size content_size);
  // modal viewport: whole canvas, parent_rect() is the anchor
  Viewport(RenderFrame& frame, Size content_size, const Rect& anchor);

  const Size& content_size() const { return content_size_; }
  const Rect& visible_rect() const { return visible_rect_; }
  const Rect& parent_rect() const { return parent_rect_; }
  bool is_empty() const { return visible_rect_.is_empty(); }
  const Point& screen_origin() const { return origin_; }
  const Style& current_style() const { return style_; }
  View* current_view() const { return view_; }

  void clipped(const Rect& rect, const Body& body);
  void clipped(const Rect& rect, const Style& style, const Body& body);

  void write(std::string_view text, const Point& at);
  void write(std::string_view text, const Point& at, const Style& style);
  void paint(const Style& style);
  void using_pen(const Style& style, const std::function<void(Pen&)>& body);

  void register_mouse(MouseInterests interests);
  void register_tick();
  void request_modal(View& view, std::function<void()> on_dismiss);

  // Used by View::render: nested frame for `view` at `rect`, then `body`.
  void render_view(View& view, const Rect& rect, const Body& body);

private:
  friend class Pen;
  Viewport(Viewport& parent, const Rect& rect, View* view);
  void put(std::string_view text, const Point& at, Style style);
  View* require_view(const char* what) const;

  RenderFrame& frame_;
  Point origin_;
  Size content_size_;
  Rect visible_rect_;
  Rect parent_rect_;
  Style style_;
  View* view_ = nullptr;
  bool top_level_ = false;
};
