#include "viewport.hpp"
#include "layout_error.hpp"
#include "unicode.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

static Rect canvas_rect(const RenderFrame& frame) { return Rect(Point::zero(), frame.canvas.size()); }

Viewport::Viewport(RenderFrame& frame, Size content_size)
  : Viewport(frame, content_size, Rect(Point::zero(), content_size)) {}

Viewport::Viewport(RenderFrame& frame, Size content_size, const Rect& anchor)
  : frame_(frame),
    content_size_(content_size),
    visible_rect_(Rect(Point::zero(), content_size).intersection(canvas_rect(frame))),
    parent_rect_(anchor),
    top_level_(true) {}

Viewport::Viewport(Viewport& parent, const Rect& rect, View* view)
  : frame_(parent.frame_),
    origin_(parent.origin_.offset(rect.origin())),
    content_size_(std::max(0, rect.size().width()), std::max(0, rect.size().height())),
    // the view rendered straight into a pass viewport sees the pass anchor
    parent_rect_(parent.top_level_ && view ? parent.parent_rect_ : rect),
    style_(parent.style_),
    view_(view ? view : parent.view_) {
  Rect clip = parent.visible_rect_.intersection(Rect(rect.origin(), content_size_));
  visible_rect_ = clip.offset(-rect.origin().x(), -rect.origin().y());
}

void Viewport::clipped(const Rect& rect, const Body& body) {
  Viewport inner(*this, rect, nullptr);
  body(inner);
}

void Viewport::clipped(const Rect& rect, const Style& style, const Body& body) {
  Viewport inner(*this, rect, nullptr);
  inner.style_ = style_.merge(style);
  body(inner);
}

void Viewport::render_view(View& view, const Rect& rect, const Body& body) {
  Viewport inner(*this, rect, &view);
  body(inner);
}

void Viewport::write(std::string_view text, const Point& at) { put(text, at, style_); }

void Viewport::write(std::string_view text, const Point& at, const Style& style) {
  put(text, at, style_.merge(style));
}

void Viewport::put(std::string_view text, const Point& at, Style style) {
  if (is_empty()) return;
  if (at.y() < visible_rect_.min_y() || at.y() >= visible_rect_.max_y()) return;
  const Style reset = style;
  int x = at.x();
  for (const auto& ch : printable_chars(text)) {
    if (Style::is_sgr(ch)) { style = Style::from_sgr(ch, style, reset); continue; }
    int w = char_width(ch);
    if (w == 0) continue;
    // clip per cell: a glyph is drawn only if all of its cells are visible
    if (x >= visible_rect_.min_x() && x + w - 1 < visible_rect_.max_x()) {
      frame_.canvas.set(origin_.offset(x, at.y()), ch, style, w);
    }
    x += w;
  }
}

void Viewport::paint(const Style& style) {
  Style s = style_.merge(style);
  visible_rect_.for_each_point([&](const Point& pt) { frame_.canvas.set(origin_.offset(pt), " ", s); });
}

void Viewport::using_pen(const Style& style, const std::function<void(Pen&)>& body) {
  struct Restore {
    Viewport& vp;
    Style saved;
    ~Restore() { vp.style_ = saved; }
  } restore{*this, style_};
  style_ = style_.merge(style);
  Pen pen(*this, style_);
  body(pen);
}

View* Viewport::require_view(const char* what) const {
  if (!view_) throw LayoutError(std::string(what) + " called outside of a view's render");
  return view_;
}

void Viewport::register_mouse(MouseInterests interests) {
  View* view = require_view("register_mouse");
  Rect visible = visible_rect_.offset(origin_.x(), origin_.y());
  frame_.mouse.push_back(MouseRegistration{view, interests, visible, origin_, frame_.in_modal});
}

void Viewport::register_tick() {
  View* view = require_view("register_tick");
  if (std::find(frame_.ticks.begin(), frame_.ticks.end(), view) == frame_.ticks.end()) {
    frame_.ticks.push_back(view);
  }
}

void Viewport::request_modal(View& view, std::function<void()> on_dismiss) {
  if (frame_.in_modal) {
    spdlog::warn("request_modal ignored while a modal is being composited");
    return;
  }
  frame_.modal = ModalRequest{&view, view_, std::move(on_dismiss), Rect(origin_, content_size_)};
}

void Pen::replace_pen(const Style& style) { viewport_.style_ = style; }

void Pen::apply_sgr(std::string_view token) {
  viewport_.style_ = Style::from_sgr(token, viewport_.style_, initial_);
}

const Style& Pen::style() const { return viewport_.style_; }
