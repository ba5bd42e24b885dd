#include "container.hpp"
#include "layout_error.hpp"
#include "viewport.hpp"
#include <algorithm>

Container::Container(ViewProps props) : View(std::move(props)) {}

Container::~Container() {
  // children go first; clear their back pointers so nothing reaches a dead parent
  for (auto& c : children_) c->parent_ = nullptr;
}

View* Container::add_view(std::unique_ptr<View> child) {
  if (!child) throw LayoutError("Container::add: null child");
  if (child->parent_) throw LayoutError("Container::add: view already has a parent");
  View* raw = child.get();
  raw->will_move_to(this);
  raw->parent_ = this;
  children_.push_back(std::move(child));
  if (screen()) raw->move_to_screen(screen());
  invalidate_size();
  return raw;
}

std::unique_ptr<View> Container::remove(View* child) {
  auto it = std::find_if(children_.begin(), children_.end(),
                         [&](const std::unique_ptr<View>& c) { return c.get() == child; });
  if (it == children_.end()) throw LayoutError("Container::remove: view is not a child of this container");
  std::unique_ptr<View> out = std::move(*it);
  children_.erase(it);
  out->parent_ = nullptr;
  out->move_to_screen(nullptr);
  out->did_move_from(this);
  invalidate_size();
  return out;
}

void Container::remove_all() {
  while (!children_.empty()) remove(children_.back().get());
}

void Container::receive_key(const KeyEvent& event) {
  // by index: a handler may remove a child
  for (size_t i = 0; i < children_.size(); ++i) children_[i]->receive_key(event);
}

void Container::move_to_screen(Screen* screen) {
  View::move_to_screen(screen);
  for (auto& c : children_) c->move_to_screen(screen);
}

Size Container::do_natural_size(Size available) {
  Size size;
  for (auto& c : children_) size = size.max(c->natural_size(available));
  return size;
}

void Container::do_render(Viewport& viewport) { render_children(viewport); }

void Container::render_children(Viewport& viewport) {
  for (auto& c : children_) c->render(viewport);
}

void Container::render_child(View& child, Viewport& viewport) {
  if (child.parent_ != this) throw LayoutError("Container::render_child: view is not a child of this container");
  child.render(viewport);
}
