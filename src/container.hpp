#pragma once
/*
 * Container
 *
 * Purpose: a View owning an ordered list of children.
 * Order: insertion order is paint order; for overlapping mouse regions the
 *        last painted child wins.
 * Default policy: overlay every child in the container's own viewport.
 *        Layout policies (Stack, ...) override do_natural_size/do_render.
 */
#include <memory>
#include <vector>
#include "view.hpp"

class Container : public View {
public:
  explicit Container(ViewProps props = {});
  ~Container() override;

  template <class T>
  T* add(std::unique_ptr<T> child) {
    T* raw = child.get();
    add_view(std::move(child));
    return raw;
  }
  View* add_view(std::unique_ptr<View> child);
  // throws LayoutError when `child` is not owned by this container
  std::unique_ptr<View> remove(View* child);
  void remove_all();

  const std::vector<std::unique_ptr<View>>& children() const { return children_; }
  size_t child_count() const { return children_.size(); }

  void receive_key(const KeyEvent& event) override;
  void move_to_screen(Screen* screen) override;
  const char* type_name() const override { return "Container"; }

protected:
  Size do_natural_size(Size available) override;
  void do_render(Viewport& viewport) override;
  void render_children(Viewport& viewport);
  // throws LayoutError when `child` is not owned by this container
  void render_child(View& child, Viewport& viewport);

private:
  std::vector<std::unique_ptr<View>> children_;
};
