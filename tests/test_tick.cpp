#include "headless_terminal.hpp"
#include "screen.hpp"
#include "stack.hpp"
#include "viewport.hpp"
#include <cassert>
#include <functional>
#include <memory>

namespace {

// registers for ticks until it has seen `frames` of them
class Countdown : public View {
public:
  explicit Countdown(int frames) : remaining(frames) {}
  int remaining;
  int ticks = 0;
  double elapsed = 0;

  bool receive_tick(double dt_ms) override {
    ticks++;
    elapsed += dt_ms;
    if (remaining > 0) remaining--;
    return remaining > 0;
  }

protected:
  Size do_natural_size(Size) override { return Size(1, 1); }
  void do_render(Viewport& viewport) override {
    if (remaining > 0) viewport.register_tick();
  }
};

class Quitter : public View {
public:
  int keys = 0;
  void receive_key(const KeyEvent& event) override {
    keys++;
    if (event.text == "q") screen()->quit();
  }

protected:
  Size do_natural_size(Size) override { return Size(1, 1); }
  void do_render(Viewport&) override {}
};

// ticks forever; counts live instances so tests can see it destroyed
class Spinner : public View {
public:
  static inline int alive = 0;
  Spinner() { alive++; }
  ~Spinner() override { alive--; }
  std::function<void()> on_tick;
  int ticks = 0;

  bool receive_tick(double) override {
    ticks++;
    if (on_tick) on_tick();
    return true;
  }

protected:
  Size do_natural_size(Size) override { return Size(1, 1); }
  void do_render(Viewport& viewport) override { viewport.register_tick(); }
};

// drops its spinner on "x", quits on "q"
class Host : public Stack {
public:
  View* spinner = nullptr;
  void receive_key(const KeyEvent& event) override {
    if (event.text == "x" && spinner) {
      remove(spinner);
      spinner = nullptr;
    } else if (event.text == "q") {
      screen()->quit();
    }
  }
};

void test_tick_dispatch() {
  HeadlessTerminal term(TermSize{5, 20});
  Screen screen(term);
  auto root = std::make_unique<Stack>();
  Countdown* a = root->add(std::make_unique<Countdown>(2));
  Countdown* idle = root->add(std::make_unique<Countdown>(0));
  screen.set_root(std::move(root));

  screen.render();
  assert(screen.needs_tick());
  assert(screen.tick(16));
  assert(a->ticks == 1 && a->elapsed == 16);
  assert(idle->ticks == 0);

  // the view dropped out once it returned false, without a new render
  assert(!screen.tick(16));
  assert(!screen.needs_tick());
  assert(!screen.tick(16));
  assert(a->ticks == 2);

  screen.render();
  assert(!screen.needs_tick());
}

void test_run_loop_ticks_then_blocks() {
  HeadlessTerminal term(TermSize{5, 20});
  Screen screen(term);
  auto root = std::make_unique<Stack>();
  Countdown* a = root->add(std::make_unique<Countdown>(3));
  screen.set_root(std::move(root));

  // empty input: timed reads while animating, then the blocking read ends the loop
  screen.run();
  assert(a->remaining == 0);
  assert(term.timeouts() == 3);
}

void test_run_loop_quit() {
  HeadlessTerminal term(TermSize{5, 20});
  Screen screen(term);
  auto quitter = std::make_unique<Quitter>();
  Quitter* q = quitter.get();
  screen.set_root(std::move(quitter));

  term.push_event(KeyEvent{Key::Char, "a"});
  term.push_event(KeyEvent{Key::Char, "q"});
  term.push_event(KeyEvent{Key::Char, "b"});
  screen.run();
  assert(q->keys == 2);
  assert(term.pending() == 1);

  HeadlessTerminal term2(TermSize{5, 20});
  Screen screen2(term2);
  auto quitter2 = std::make_unique<Quitter>();
  Quitter* q2 = quitter2.get();
  screen2.set_root(std::move(quitter2));
  term2.push_event(KeyEvent{Key::Char, "c", true});
  term2.push_event(KeyEvent{Key::Char, "a"});
  screen2.run();
  assert(q2->keys == 0);
  assert(term2.pending() == 1);
}

void test_removed_view_is_not_ticked() {
  HeadlessTerminal term(TermSize{5, 20});
  Screen screen(term);
  auto host = std::make_unique<Host>();
  Host* h = host.get();
  h->spinner = h->add(std::make_unique<Spinner>());
  screen.set_root(std::move(host));
  assert(Spinner::alive == 1);

  // the key removes the spinner between the render that registered it and the next tick
  term.push_event(KeyEvent{Key::Char, "x"});
  term.push_event(KeyEvent{Key::Char, "q"});
  screen.run();
  assert(Spinner::alive == 0);
  assert(!screen.needs_tick());
  assert(term.pending() == 0);
}

void test_tick_handler_removes_sibling() {
  HeadlessTerminal term(TermSize{5, 20});
  Screen screen(term);
  auto root = std::make_unique<Stack>();
  Stack* r = root.get();
  Spinner* first = r->add(std::make_unique<Spinner>());
  Spinner* second = r->add(std::make_unique<Spinner>());
  first->on_tick = [r, &second] {
    if (second) {
      r->remove(second);
      second = nullptr;
    }
  };
  screen.set_root(std::move(root));
  screen.render();
  assert(Spinner::alive == 2);

  assert(screen.tick(16));
  assert(Spinner::alive == 1);
  assert(first->ticks == 1);
  assert(screen.tick(16));
  assert(first->ticks == 2);

  screen.render();
  assert(screen.needs_tick());
}

} // namespace

int main() {
  test_tick_dispatch();
  test_run_loop_ticks_then_blocks();
  test_run_loop_quit();
  test_removed_view_is_not_ticked();
  test_tick_handler_removes_sibling();
  return 0;
}
