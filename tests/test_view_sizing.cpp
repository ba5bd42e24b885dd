#include "canvas.hpp"
#include "container.hpp"
#include "layout_error.hpp"
#include "viewport.hpp"
#include <cassert>
#include <memory>

namespace {

class Probe : public View {
public:
  explicit Probe(Size natural, ViewProps props = {}) : View(std::move(props)), natural_(natural) {}
  void set_natural(Size s) { natural_ = s; }
  int calls = 0;
  Size last_available;

protected:
  Size do_natural_size(Size available) override {
    calls++;
    last_available = available;
    return natural_;
  }
  void do_render(Viewport&) override {}

private:
  Size natural_;
};

class SelfSizing : public View {
protected:
  Size do_natural_size(Size available) override { return natural_size(available); }
  void do_render(Viewport&) override {}
};

class Negative : public View {
protected:
  Size do_natural_size(Size) override { return Size(-1, 0); }
  void do_render(Viewport&) override {}
};

// renders its only child into a rect whose size is a render-time choice
class Frame : public Container {
public:
  int inner_width = 5;
  int calls = 0;

protected:
  Size do_natural_size(Size available) override {
    calls++;
    return Container::do_natural_size(available);
  }
  void do_render(Viewport& viewport) override {
    viewport.clipped(Rect(0, 0, inner_width, 1), [&](Viewport& inside) { render_child(*children()[0], inside); });
  }
};

void render_into(View& view, Size size) {
  Canvas canvas(size);
  RenderFrame frame(canvas);
  Viewport viewport(frame, size);
  view.render(viewport);
}

void test_cache() {
  Probe p(Size(4, 2));
  assert(p.natural_size(Size(20, 10)) == Size(4, 2));
  assert(p.natural_size(Size(20, 10)) == Size(4, 2));
  assert(p.calls == 1);
  assert(p.cached_size_count() == 1);

  p.natural_size(Size(30, 10));
  assert(p.calls == 2);
  assert(p.cached_size_count() == 2);

  p.set_natural(Size(8, 1));
  p.invalidate_size();
  assert(p.cached_size_count() == 0);
  assert(p.natural_size(Size(20, 10)) == Size(8, 1));
  assert(p.calls == 3);
}

void test_explicit_size() {
  Probe p(Size(4, 2), ViewProps{.width = 5, .height = 3});
  // explicit size wins even when less space is available
  assert(p.natural_size(Size(2, 2)) == Size(5, 3));
  assert(p.calls == 0);

  Probe fill(Size(4, 2), ViewProps{.width = Dimension::fill()});
  assert(fill.natural_size(Size(20, 10)) == Size(20, 2));

  Probe natural(Size(4, 2), ViewProps{.width = Dimension::natural(), .height = Dimension::fill()});
  assert(natural.natural_size(Size(20, 10)) == Size(4, 10));
}

void test_min_max() {
  Probe p(Size(4, 2), ViewProps{.min_width = 6, .max_height = 1});
  assert(p.natural_size(Size(20, 10)) == Size(6, 1));

  // min/max do not apply to a set dimension
  Probe q(Size(4, 2), ViewProps{.width = 3, .min_width = 6});
  assert(q.natural_size(Size(20, 10)) == Size(3, 2));
}

void test_padding_and_offset() {
  Probe padded(Size(4, 2), ViewProps{.padding = Edges::all(1)});
  assert(padded.natural_size(Size(20, 10)) == Size(6, 4));

  Probe offset(Size(4, 2), ViewProps{.x = 2, .y = 1});
  assert(offset.natural_size(Size(20, 10)) == Size(6, 3));
  assert(offset.last_available == Size(18, 9));

  // padding larger than the viewport degrades to a zero content size
  Probe tiny(Size(4, 2), ViewProps{.padding = Edges::all(5)});
  render_into(tiny, Size(4, 4));
  assert(tiny.content_size() == Size(0, 0));
}

void test_update_invalidates() {
  Probe p(Size(4, 2));
  p.natural_size(Size(20, 10));
  p.update(ViewProps{.width = 7});
  assert(p.cached_size_count() == 0);
  assert(p.natural_size(Size(20, 10)) == Size(7, 2));
}

void test_invalidation_propagates() {
  Container root;
  Container* middle = root.add(std::make_unique<Container>());
  Probe* leaf = middle->add(std::make_unique<Probe>(Size(3, 1)));

  assert(root.natural_size(Size(10, 10)) == Size(3, 1));
  assert(root.cached_size_count() == 1);
  assert(middle->cached_size_count() == 1);

  leaf->set_natural(Size(5, 2));
  leaf->invalidate_size();
  assert(middle->cached_size_count() == 0);
  assert(root.cached_size_count() == 0);
  assert(root.natural_size(Size(10, 10)) == Size(5, 2));
}

void test_render_size_change_stays_local() {
  Frame frame;
  Probe* leaf = frame.add(std::make_unique<Probe>(Size(3, 1)));
  render_into(frame, Size(10, 4));
  assert(leaf->content_size() == Size(5, 1));
  assert(frame.natural_size(Size(10, 4)) == Size(3, 1));
  assert(frame.calls == 1);
  assert(frame.cached_size_count() == 1);
  assert(leaf->cached_size_count() == 1);

  // same outer size, different inner viewport for the child
  frame.inner_width = 7;
  render_into(frame, Size(10, 4));
  assert(leaf->content_size() == Size(7, 1));
  assert(leaf->cached_size_count() == 0);
  assert(frame.cached_size_count() == 1);
  frame.natural_size(Size(10, 4));
  assert(frame.calls == 1);

  // an explicit invalidation does reach the parent
  leaf->invalidate_size();
  assert(frame.cached_size_count() == 0);
}

void test_errors() {
  SelfSizing s;
  bool threw = false;
  try { s.natural_size(Size(5, 5)); } catch (const LayoutError&) { threw = true; }
  assert(threw);

  Negative n;
  threw = false;
  try { n.natural_size(Size(5, 5)); } catch (const LayoutError&) { threw = true; }
  assert(threw);

  // degenerate input is not an error
  Probe p(Size(0, 0));
  assert(p.natural_size(Size(0, 0)) == Size(0, 0));
}

} // namespace

int main() {
  test_cache();
  test_explicit_size();
  test_min_max();
  test_padding_and_offset();
  test_update_invalidates();
  test_invalidation_propagates();
  test_render_size_change_stays_local();
  test_errors();
  return 0;
}
