#include "stack.hpp"
#include "viewport.hpp"
#include <algorithm>

void Stack::set_direction(Direction d) {
  if (direction_ == d) return;
  direction_ = d;
  invalidate_size();
}

Size Stack::do_natural_size(Size available) {
  Size remaining = available;
  int w = 0, h = 0;
  for (const auto& c : children()) {
    Size s = c->natural_size(remaining);
    if (direction_ == Direction::TopToBottom) {
      remaining = remaining.shrink(0, s.height());
      w = std::max(w, s.width());
      h += s.height();
    } else {
      remaining = remaining.shrink(s.width(), 0);
      w += s.width();
      h = std::max(h, s.height());
    }
  }
  return Size(w, h);
}

void Stack::do_render(Viewport& viewport) {
  Size remaining = viewport.content_size();
  int pos = 0;
  for (const auto& c : children()) {
    if (direction_ == Direction::TopToBottom && pos >= viewport.visible_rect().max_y()) break;
    if (direction_ == Direction::LeftToRight && pos >= viewport.visible_rect().max_x()) break;
    Size s = c->natural_size(remaining);
    Rect rect = direction_ == Direction::TopToBottom
                  ? Rect(0, pos, remaining.width(), std::min(s.height(), remaining.height()))
                  : Rect(pos, 0, std::min(s.width(), remaining.width()), remaining.height());
    viewport.clipped(rect, [&](Viewport& inner) { render_child(*c, inner); });
    if (direction_ == Direction::TopToBottom) {
      remaining = remaining.shrink(0, s.height());
      pos += s.height();
    } else {
      remaining = remaining.shrink(s.width(), 0);
      pos += s.width();
    }
  }
}
