#include "canvas.hpp"
#include "container.hpp"
#include "inspect.hpp"
#include "layout_error.hpp"
#include "stack.hpp"
#include "text.hpp"
#include "viewport.hpp"
#include <cassert>
#include <memory>
#include <string>
#include <vector>

namespace {

struct Lifecycle {
  std::vector<std::string> calls;
};

class Block : public View {
public:
  Block(Size natural, ViewProps props = {}, Lifecycle* log = nullptr)
    : View(std::move(props)), natural_(natural), log_(log) {}
  Point origin;
  Rect parent_rect;

  void will_move_to(View*) override { if (log_) log_->calls.push_back("will_move_to"); }
  void did_move_from(View*) override { if (log_) log_->calls.push_back("did_move_from"); }

protected:
  Size do_natural_size(Size) override { return natural_; }
  void do_render(Viewport& viewport) override {
    origin = viewport.screen_origin();
    viewport.write("#", Point(0, 0));
  }

private:
  Size natural_;
  Lifecycle* log_;
};

// tries to render a view it does not own
class Thief : public Container {
public:
  View* victim = nullptr;

protected:
  void do_render(Viewport& viewport) override { render_child(*victim, viewport); }
};

void test_stack_scenario() {
  Stack stack(Stack::Direction::TopToBottom);
  Block* a = stack.add(std::make_unique<Block>(Size(4, 3), ViewProps{.width = Dimension::fill()}));
  Block* b = stack.add(std::make_unique<Block>(Size(4, 3), ViewProps{.width = Dimension::fill()}));
  assert(stack.child_count() == 2);
  assert(a->parent() == &stack);

  assert(stack.natural_size(Size(10, 10)) == Size(10, 6));

  Canvas canvas(Size(10, 10));
  RenderFrame frame(canvas);
  Viewport root(frame, canvas.size());
  stack.render(root);
  assert(a->content_size() == Size(10, 3));
  assert(b->content_size() == Size(10, 3));
  assert(a->origin == Point(0, 0));
  assert(b->origin == Point(0, 3));
  assert(canvas.at(0, 3).glyph == "#");

  std::string tree = describe_tree(stack);
  assert(tree.find("Stack 10x10") == 0);
  assert(tree.find("  View 10x3 width=fill") != std::string::npos);
}

void test_left_to_right() {
  Stack row(Stack::Direction::LeftToRight);
  row.add(std::make_unique<Block>(Size(3, 1)));
  row.add(std::make_unique<Block>(Size(4, 2)));
  assert(row.natural_size(Size(20, 5)) == Size(7, 2));
  assert(row.cached_size_count() == 1);

  row.set_direction(Stack::Direction::TopToBottom);
  assert(row.natural_size(Size(20, 5)) == Size(4, 3));
}

void test_overlay_default() {
  Container c;
  c.add(std::make_unique<Block>(Size(3, 5)));
  c.add(std::make_unique<Block>(Size(6, 2)));
  assert(c.natural_size(Size(20, 20)) == Size(6, 5));
}

void test_add_remove() {
  Lifecycle log;
  Container c;
  auto owned = std::make_unique<Block>(Size(1, 1), ViewProps{}, &log);
  Block* raw = c.add(std::move(owned));
  c.natural_size(Size(5, 5));
  assert(c.cached_size_count() == 1);

  std::unique_ptr<View> back = c.remove(raw);
  assert(back.get() == raw);
  assert(raw->parent() == nullptr);
  assert(c.child_count() == 0);
  assert(c.cached_size_count() == 0);
  assert((log.calls == std::vector<std::string>{"will_move_to", "did_move_from"}));

  Block stranger(Size(1, 1));
  bool threw = false;
  try { c.remove(&stranger); } catch (const LayoutError&) { threw = true; }
  assert(threw);

  threw = false;
  try { c.add_view(nullptr); } catch (const LayoutError&) { threw = true; }
  assert(threw);

  c.add_view(std::move(back));
  assert(raw->parent() == &c);
  c.remove_all();
  assert(c.child_count() == 0);
}

void test_render_foreign_child() {
  Thief thief;
  Block outsider(Size(1, 1));
  thief.victim = &outsider;
  Canvas canvas(Size(4, 4));
  RenderFrame frame(canvas);
  Viewport root(frame, canvas.size());
  bool threw = false;
  try { thief.render(root); } catch (const LayoutError&) { threw = true; }
  assert(threw);
}

void test_theme_inheritance() {
  Container outer(ViewProps{.theme = Theme::primary()});
  Container* inner = outer.add(std::make_unique<Container>());
  Text* leaf = inner->add(std::make_unique<Text>(TextProps{"x"}));
  assert(leaf->theme() == Theme::primary());
  leaf->set_theme(Theme::selected());
  assert(leaf->theme() == Theme::selected());
  Text loose(TextProps{"y"});
  assert(loose.theme() == Theme::plain());
}

} // namespace

int main() {
  test_stack_scenario();
  test_left_to_right();
  test_overlay_default();
  test_add_remove();
  test_render_foreign_child();
  test_theme_inheritance();
  return 0;
}
