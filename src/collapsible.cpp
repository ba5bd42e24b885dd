#include "collapsible.hpp"
#include "viewport.hpp"

Collapsible::Collapsible(std::unique_ptr<View> collapsed, std::unique_ptr<View> expanded, bool is_collapsed,
                         ViewProps props)
  : Container(std::move(props)), is_collapsed_(is_collapsed) {
  collapsed_ = add_view(std::move(collapsed));
  expanded_ = add_view(std::move(expanded));
}

void Collapsible::set_collapsed(bool collapsed) {
  if (is_collapsed_ == collapsed) return;
  is_collapsed_ = collapsed;
  invalidate_size();
}

Size Collapsible::do_natural_size(Size available) {
  return current()->natural_size(available.shrink(2, 0)).grow(2, 0);
}

void Collapsible::receive_mouse(const MouseEvent& event) {
  if (is_mouse_pressed(event)) {
    is_pressed_ = true;
  } else if (is_mouse_released(event)) {
    is_pressed_ = false;
    if (is_mouse_clicked(event, content_size())) set_collapsed(!is_collapsed_);
  }

  if (is_mouse_enter(event)) is_hover_ = true;
  else if (is_mouse_exit(event)) is_hover_ = false;
}

void Collapsible::do_render(Viewport& viewport) {
  viewport.register_mouse(kMouseButtonLeft | kMouseMove);

  Style text_style = theme().text(ThemeState{is_pressed_, is_hover_});
  viewport.paint(text_style);

  Size content = viewport.content_size().shrink(2, 0);
  Size natural = current()->natural_size(content);
  viewport.write(is_collapsed_ ? "►" : "▼", Point(0, 0), text_style);
  viewport.clipped(Rect(Point(2, 0), natural), [&](Viewport& inside) { render_child(*current(), inside); });
}
