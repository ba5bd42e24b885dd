#include "accordion.hpp"
#include "text.hpp"
#include "viewport.hpp"
#include <algorithm>
#include <cmath>

namespace {
const char* const kArrowOpen = "△";
const char* const kArrowOpenHover = "▲";
const char* const kArrowClosed = "▽";
const char* const kArrowClosedHover = "▼";
const char* const kArrowAnimate[] = {"▽", "◁", "△"};
const char* const kArrowAnimateHover[] = {"▼", "◀", "▲"};

// rows per millisecond is 1/25
constexpr double kTickDivisor = 25.0;
}

AccordionSection::AccordionSection(const std::string& title, std::unique_ptr<View> view, bool is_open,
                                   ViewProps props)
  : Container(std::move(props)), is_open_(is_open) {
  title_ = add(std::make_unique<Text>(TextProps{title, title_style()}));
  view_ = add_view(std::move(view));
}

const std::string& AccordionSection::title() const { return title_->text(); }
void AccordionSection::set_title(const std::string& title) { title_->set_text(title); }

Style AccordionSection::title_style() const {
  Style s;
  s.underline = true;
  s.bold = is_open_;
  return s;
}

void AccordionSection::set_open(bool open) {
  if (is_open_ == open) return;
  is_open_ = open;
  title_->set_style(title_style());
  invalidate_size();
  if (on_click_) on_click_(*this, is_open_);
}

bool AccordionSection::is_animating() const {
  return current_view_height_ != (is_open_ ? actual_view_height_ : 0);
}

Size AccordionSection::do_natural_size(Size available) {
  // 4: left margin + " ▽ ", 1: separator row
  Size collapsed = title_->natural_size(available).grow(4, 1);
  Size remaining = available.shrink(0, collapsed.height());
  // 1: left margin only
  Size view = view_->natural_size(remaining).grow(1, 0);
  return current_size(collapsed, view);
}

Size AccordionSection::current_size(Size collapsed, Size view) {
  if (actual_view_height_ == 0) current_view_height_ = is_open_ ? view.height() : 0;
  actual_view_height_ = view.height();
  return Size(std::max(view.width(), collapsed.width()),
              collapsed.height() + static_cast<int>(std::lround(current_view_height_)));
}

void AccordionSection::receive_mouse(const MouseEvent& event) {
  if (is_mouse_enter(event)) is_hover_ = true;
  else if (is_mouse_exit(event)) is_hover_ = false;

  // only the title row toggles; the body may be interactive itself
  if (is_mouse_clicked(event, content_size()) && event.position.y() < title_height_) set_open(!is_open_);
}

bool AccordionSection::receive_tick(double dt_ms) {
  if (actual_view_height_ == 0) {
    current_view_height_ = 0;
    return false;
  }

  double amount = dt_ms / kTickDivisor;
  if (is_open_) current_view_height_ = std::min<double>(actual_view_height_, current_view_height_ + amount);
  else current_view_height_ = std::max(0.0, current_view_height_ - amount);
  invalidate_size();
  return is_animating();
}

void AccordionSection::do_render(Viewport& viewport) {
  if (is_animating()) viewport.register_tick();
  viewport.register_mouse(kMouseButtonLeft | kMouseMove);

  const Size content = viewport.content_size();
  const Style text_style = theme().text();
  const Size title_size = title_->natural_size(content);
  title_height_ = title_size.height();

  viewport.clipped(Rect(1, 0, std::max(0, content.width() - 4), title_size.height()),
                   [&](Viewport& inside) { render_child(*title_, inside); });

  int body_height = static_cast<int>(std::lround(current_view_height_));
  if (body_height > 0) {
    viewport.clipped(Rect(0, title_size.height(), content.width(), body_height),
                     [&](Viewport& inside) { render_child(*view_, inside); });
  }

  viewport.clipped(Rect(content.width() - 3, 0, 3, 1), text_style, [&](Viewport& inside) {
    const char* arrow;
    if (is_animating()) {
      const auto& frames = is_hover_ ? kArrowAnimateHover : kArrowAnimate;
      double index = interpolate(current_view_height_, {0, actual_view_height_}, {0, 2});
      arrow = frames[std::clamp(static_cast<int>(std::lround(index)), 0, 2)];
    } else if (is_open_) {
      arrow = is_hover_ ? kArrowOpenHover : kArrowOpen;
    } else {
      arrow = is_hover_ ? kArrowClosedHover : kArrowClosed;
    }
    inside.write(arrow, Point(1, 0));
  });

  viewport.clipped(Rect(0, content.height() - 1, content.width(), 1), text_style, [&](Viewport& inside) {
    const int w = inside.content_size().width();
    if (w <= 0) return;
    std::string line = "╶";
    for (int i = 2; i < w; ++i) line += "─";
    if (w > 1) line += "╴";
    inside.write(line, Point(0, 0));
  });
}

AccordionSection* Accordion::add_section(const std::string& title, std::unique_ptr<View> view, bool is_open) {
  return add_section(std::make_unique<AccordionSection>(title, std::move(view), is_open));
}

AccordionSection* Accordion::add_section(std::unique_ptr<AccordionSection> section) {
  section->set_on_click([this](AccordionSection& s, bool is_open) { section_did_change(s, is_open); });
  if (!multiple_ && section->is_open()) {
    for (auto* other : sections()) other->close();
  }
  return add(std::move(section));
}

std::vector<AccordionSection*> Accordion::sections() const {
  std::vector<AccordionSection*> out;
  for (const auto& child : children()) {
    if (auto* s = dynamic_cast<AccordionSection*>(child.get())) out.push_back(s);
  }
  return out;
}

void Accordion::section_did_change(AccordionSection& section, bool is_open) {
  if (multiple_ || !is_open) return;
  for (auto* other : sections()) {
    if (other != &section) other->close();
  }
}

Size Accordion::do_natural_size(Size available) {
  Size remaining = available;
  MutableSize size;
  for (auto* section : sections()) {
    Size s = section->natural_size(remaining);
    remaining = remaining.shrink(0, s.height());
    size.width = std::max(size.width, s.width());
    size.height += s.height();
  }
  return size.freeze();
}

void Accordion::do_render(Viewport& viewport) {
  Size remaining = viewport.content_size();
  int y = 0;
  for (auto* section : sections()) {
    if (y >= viewport.visible_rect().max_y()) break;
    Size s = section->natural_size(remaining);
    remaining = remaining.shrink(0, s.height());
    viewport.clipped(Rect(0, y, remaining.width(), s.height()),
                     [&](Viewport& inside) { render_child(*section, inside); });
    y += s.height();
  }
}
