#pragma once
/*
 * Screen
 *
 * Purpose: drive frames for one root view against an ITerminal.
 *   render(): root pass + modal overlay pass into a Canvas, then flush.
 *   dispatch_mouse/dispatch_key/tick(): route input using the registrations
 *   recorded by the most recent render pass.
 * Threading: single-threaded; run() finishes the render an input triggers
 *   before reading the next input.
 */
#include <chrono>
#include <memory>
#include <optional>
#include <vector>
#include "canvas.hpp"
#include "config.hpp"
#include "events.hpp"
#include "iterminal.hpp"
#include "viewport.hpp"

class View;

class Screen {
public:
  Screen(ITerminal& term, Config config = {});
  ~Screen();
  Screen(const Screen&) = delete;
  Screen& operator=(const Screen&) = delete;

  void set_root(std::unique_ptr<View> root);
  View* root() const { return root_.get(); }
  const Config& config() const { return config_; }
  const Canvas& canvas() const { return canvas_; }
  Size size() const { return canvas_.size(); }

  void render();
  void resize(Size size);

  // true when some view received the event
  bool dispatch_mouse(const MouseEvent& event);
  bool dispatch_key(const KeyEvent& event);
  bool dispatch(const InputEvent& event);

  // Advance animations by dt milliseconds; true while any view wants more.
  bool tick(double dt_ms);
  bool needs_tick() const { return needs_tick_; }

  bool has_modal() const { return modal_.has_value(); }
  View* modal_view() const { return modal_ ? modal_->view : nullptr; }
  void dismiss_modal();

  // Drop every reference to a view leaving the tree: ticks, mouse regions,
  // hover and capture, and a modal it shows or asked for.
  void forget(View* view);

  void run();
  void quit() { quit_ = true; }

private:
  const MouseRegistration* hit_test(const Point& pt, const MouseEvent& probe) const;
  const MouseRegistration* find_registration(const View* view) const;
  void deliver(const MouseRegistration& reg, MouseEvent event, const Point& absolute);
  void update_hover(const MouseEvent& event);
  void flush();

  ITerminal& term_;
  Config config_;
  std::unique_ptr<View> root_;
  Canvas canvas_;

  std::vector<MouseRegistration> mouse_;
  std::vector<View*> ticks_;
  std::optional<ModalRequest> modal_;
  View* hover_ = nullptr;
  View* capture_ = nullptr;
  bool needs_tick_ = false;
  bool quit_ = false;
  bool ticking_ = false;
};
