#include "view.hpp"
#include "layout_error.hpp"
#include "screen.hpp"
#include "viewport.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <string>

namespace {

struct ReentryGuard {
  ReentryGuard(bool& flag, const char* what) : flag_(flag) {
    if (flag_) throw LayoutError(std::string("reentrant ") + what);
    flag_ = true;
  }
  ~ReentryGuard() { flag_ = false; }
  bool& flag_;
};

} // namespace

View::View(ViewProps props) : props_(std::move(props)) {}

const Theme& View::theme() const {
  if (props_.theme) return *props_.theme;
  if (parent_) return parent_->theme();
  return Theme::plain();
}

bool View::debug() const {
  return props_.debug || (screen_ && screen_->config().debug_layout);
}

void View::update(ViewProps props) {
  props_ = std::move(props);
  invalidate_size();
}

void View::invalidate_size() {
  size_cache_.clear();
  if (invalidate_parent_ && parent_) parent_->invalidate_size();
}

void View::invalidate_self_only() {
  invalidate_parent_ = false;
  invalidate_size();
  invalidate_parent_ = true;
}

template <class CalcFn>
Size View::restrict_size(CalcFn calc_size, Size available, Prefer prefer) const {
  std::optional<Size> memo;
  auto calc = [&]() -> const Size& {
    if (!memo) memo = calc_size();
    return *memo;
  };

  const Dimension& w = props_.width;
  const Dimension& h = props_.height;
  if (w.is_set() && h.is_set()) {
    // explicit or fill on both axes: min/max never apply
    int width = w.resolve(available.width(), [&] { return calc().width(); });
    int height = h.resolve(available.height(), [&] { return calc().height(); });
    return Size(width, height);
  }

  MutableSize size = (prefer == Prefer::Shrink ? calc() : available).mutable_copy();

  if (w.is_set()) {
    size.width = w.resolve(available.width(), [&] { return calc().width(); });
  } else {
    if (props_.min_width) size.width = std::max(*props_.min_width, size.width);
    if (props_.max_width) size.width = std::min(*props_.max_width, size.width);
  }

  if (h.is_set()) {
    size.height = h.resolve(available.height(), [&] { return calc().height(); });
  } else {
    if (props_.min_height) size.height = std::max(*props_.min_height, size.height);
    if (props_.max_height) size.height = std::min(*props_.max_height, size.height);
  }

  return size.freeze();
}

Size View::natural_size(Size available) {
  auto key = std::make_pair(available.width(), available.height());
  if (auto it = size_cache_.find(key); it != size_cache_.end()) return it->second;

  ReentryGuard guard(in_natural_size_, "natural_size");
  int x = props_.x.value_or(0);
  int y = props_.y.value_or(0);
  Size inner = (x || y) ? available.shrink(x, y) : available;

  Size size = restrict_size([&] {
    Size s = do_natural_size(inner);
    if (s.width() < 0 || s.height() < 0) {
      throw LayoutError(std::string(type_name()) + "::do_natural_size returned a negative size");
    }
    if (props_.padding) s = s.grow(props_.padding->horizontal(), props_.padding->vertical());
    return s;
  }, inner, Prefer::Shrink);

  size = size.grow(x, y);
  if (debug()) {
    spdlog::debug("{} natural_size({}x{}) -> {}x{}", type_name(), available.width(), available.height(),
                  size.width(), size.height());
  }
  size_cache_.emplace(key, size);
  return size;
}

void View::render(Viewport& viewport) {
  ReentryGuard guard(in_render_, "render");
  if (viewport_content_size_ != viewport.content_size()) {
    // the parent already knows its own size; only our cache is stale
    invalidate_self_only();
  }
  viewport_content_size_ = viewport.content_size();

  MutablePoint origin{props_.x.value_or(0), props_.y.value_or(0)};
  MutableSize content = viewport.content_size().mutable_copy();
  content.width -= origin.x;
  content.height -= origin.y;
  if (props_.padding) {
    origin.x += props_.padding->left;
    origin.y += props_.padding->top;
    content.width -= props_.padding->horizontal();
    content.height -= props_.padding->vertical();
  }
  Size available(std::max(0, content.width), std::max(0, content.height));

  rendered_content_size_ = restrict_size([&] { return natural_size(available); }, available, Prefer::Grow);

  Rect rect(origin.freeze(), rendered_content_size_);
  if (screen_ && screen_->config().debug_render) {
    spdlog::debug("{} render at ({},{}) {}x{}", type_name(), rect.min_x(), rect.min_y(), rect.size().width(),
                  rect.size().height());
  }
  viewport.render_view(*this, rect, [this](Viewport& inner) { do_render(inner); });
}

void View::move_to_screen(Screen* screen) {
  if (screen_ == screen) return;
  Screen* prev = screen_;
  screen_ = screen;
  if (prev) prev->forget(this);
  if (screen) {
    if (prev) did_unmount(*prev);
    did_mount(*screen);
  } else if (prev) {
    did_unmount(*prev);
  }
}
