#include "screen.hpp"
#include "view.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <type_traits>
#include <utility>
#include <variant>

Screen::Screen(ITerminal& term, Config config) : term_(term), config_(std::move(config)) {
  TermSize ts = term_.get_size();
  canvas_.resize(Size(ts.cols, ts.rows));
}

Screen::~Screen() {
  if (root_) root_->move_to_screen(nullptr);
}

void Screen::set_root(std::unique_ptr<View> root) {
  if (root_) root_->move_to_screen(nullptr);
  root_ = std::move(root);
  mouse_.clear();
  ticks_.clear();
  modal_.reset();
  hover_ = capture_ = nullptr;
  if (root_) root_->move_to_screen(this);
}

void Screen::resize(Size size) {
  spdlog::debug("screen resize {}x{}", size.width(), size.height());
  canvas_.resize(size);
}

void Screen::render() {
  canvas_.clear();
  RenderFrame frame(canvas_);
  if (root_) {
    Viewport viewport(frame, canvas_.size());
    root_->render(viewport);
  }
  if (frame.modal) {
    frame.in_modal = true;
    Viewport overlay(frame, canvas_.size(), frame.modal->anchor);
    frame.modal->view->render(overlay);
  }

  mouse_ = std::move(frame.mouse);
  ticks_ = std::move(frame.ticks);
  modal_ = std::move(frame.modal);
  needs_tick_ = !ticks_.empty();
  if (hover_ && !find_registration(hover_)) hover_ = nullptr;
  if (capture_ && !find_registration(capture_)) capture_ = nullptr;
  if (config_.debug_render) {
    spdlog::debug("frame: {} mouse regions, {} tick views, modal={}", mouse_.size(), ticks_.size(), modal_.has_value());
  }
  flush();
}

void Screen::flush() {
  const Size& sz = canvas_.size();
  for (int y = 0; y < sz.height(); ++y) {
    for (int x = 0; x < sz.width(); ++x) {
      const Cell& c = canvas_.at(x, y);
      term_.draw_cell(y, x, c.glyph, c.style);
    }
  }
  term_.flush();
}

const MouseRegistration* Screen::hit_test(const Point& pt, const MouseEvent& probe) const {
  for (auto it = mouse_.rbegin(); it != mouse_.rend(); ++it) {
    if (!it->view || (modal_ && !it->in_modal)) continue;
    if (it->visible.contains(pt) && wants_mouse(it->interests, probe)) return &*it;
  }
  return nullptr;
}

const MouseRegistration* Screen::find_registration(const View* view) const {
  for (auto it = mouse_.rbegin(); it != mouse_.rend(); ++it) {
    if (!it->view || (modal_ && !it->in_modal)) continue;
    if (it->view == view) return &*it;
  }
  return nullptr;
}

void Screen::deliver(const MouseRegistration& reg, MouseEvent event, const Point& absolute) {
  event.position = Point(absolute.x() - reg.origin.x(), absolute.y() - reg.origin.y());
  if (config_.debug_render) {
    spdlog::debug("mouse {} -> {} at ({},{})", to_string(event.action), reg.view->type_name(), event.position.x(),
                  event.position.y());
  }
  reg.view->receive_mouse(event);
}

void Screen::update_hover(const MouseEvent& event) {
  MouseEvent probe{MouseAction::Move, MouseButton::None, event.position};
  const MouseRegistration* target = hit_test(event.position, probe);
  View* next = target ? target->view : nullptr;
  if (next == hover_) return;
  if (const MouseRegistration* prev = hover_ ? find_registration(hover_) : nullptr) {
    deliver(*prev, MouseEvent{MouseAction::Exit, MouseButton::None, {}}, event.position);
  }
  // the exit handler may have removed the next view
  if (target && !target->view) target = nullptr;
  hover_ = target ? target->view : nullptr;
  if (target) deliver(*target, MouseEvent{MouseAction::Enter, MouseButton::None, {}}, event.position);
}

bool Screen::dispatch_mouse(const MouseEvent& event) {
  const Point& pt = event.position;

  if (modal_ && event.action == MouseAction::Press) {
    bool inside = std::any_of(mouse_.begin(), mouse_.end(),
                              [&](const MouseRegistration& r) { return r.in_modal && r.visible.contains(pt); });
    if (!inside) {
      dismiss_modal();
      return true;
    }
  }

  switch (event.action) {
    case MouseAction::Enter:
    case MouseAction::Exit:
    case MouseAction::Move: {
      bool handled = false;
      if (capture_) {
        // drag: the pressed view keeps seeing moves even outside its area
        const MouseRegistration* reg = find_registration(capture_);
        if (reg && (reg->interests & kMouseMove)) {
          deliver(*reg, MouseEvent{MouseAction::Move, MouseButton::None, {}}, pt);
          handled = true;
        }
      }
      update_hover(event);
      if (!handled && hover_) {
        if (const MouseRegistration* reg = find_registration(hover_)) {
          deliver(*reg, MouseEvent{MouseAction::Move, MouseButton::None, {}}, pt);
          handled = true;
        }
      }
      return handled;
    }
    case MouseAction::Press: {
      update_hover(event);
      const MouseRegistration* target = hit_test(pt, event);
      if (!target) return false;
      capture_ = target->view;
      deliver(*target, event, pt);
      return true;
    }
    case MouseAction::Release: {
      const MouseRegistration* target = capture_ ? find_registration(capture_) : hit_test(pt, event);
      capture_ = nullptr;
      if (!target) return false;
      deliver(*target, event, pt);
      return true;
    }
    case MouseAction::WheelUp:
    case MouseAction::WheelDown: {
      const MouseRegistration* target = hit_test(pt, event);
      if (!target) return false;
      deliver(*target, event, pt);
      return true;
    }
  }
  return false;
}

bool Screen::dispatch_key(const KeyEvent& event) {
  if (modal_) {
    if (event.key == Key::Escape) { dismiss_modal(); return true; }
    modal_->view->receive_key(event);
    return true;
  }
  if (!root_) return false;
  root_->receive_key(event);
  return true;
}

bool Screen::dispatch(const InputEvent& event) {
  return std::visit([this](const auto& ev) -> bool {
    using T = std::decay_t<decltype(ev)>;
    if constexpr (std::is_same_v<T, KeyEvent>) return dispatch_key(ev);
    else if constexpr (std::is_same_v<T, MouseEvent>) return dispatch_mouse(ev);
    else { resize(ev.size); return true; }
  }, event);
}

void Screen::dismiss_modal() {
  if (!modal_) return;
  ModalRequest req = std::move(*modal_);
  modal_.reset();
  hover_ = capture_ = nullptr;
  if (req.on_dismiss) req.on_dismiss();
}

bool Screen::tick(double dt_ms) {
  ticking_ = true;
  // by index: forget() nulls entries of views removed by a tick handler
  for (size_t i = 0; i < ticks_.size(); ++i) {
    View* v = ticks_[i];
    if (v && !v->receive_tick(dt_ms)) ticks_[i] = nullptr;
  }
  ticking_ = false;
  ticks_.erase(std::remove(ticks_.begin(), ticks_.end(), nullptr), ticks_.end());
  needs_tick_ = !ticks_.empty();
  return needs_tick_;
}

void Screen::forget(View* view) {
  if (!view) return;
  if (ticking_) std::replace(ticks_.begin(), ticks_.end(), view, static_cast<View*>(nullptr));
  else ticks_.erase(std::remove(ticks_.begin(), ticks_.end(), view), ticks_.end());
  needs_tick_ = std::any_of(ticks_.begin(), ticks_.end(), [](View* v) { return v != nullptr; });

  // registrations are nulled, not erased: dispatch may hold a pointer into mouse_
  bool drop_modal = modal_ && (modal_->view == view || modal_->owner == view);
  for (auto& reg : mouse_) {
    if (reg.view == view || (drop_modal && reg.in_modal)) reg.view = nullptr;
  }
  if (drop_modal) {
    if (hover_ == modal_->view) hover_ = nullptr;
    if (capture_ == modal_->view) capture_ = nullptr;
    // the owner is going away, so its dismiss callback is not run
    modal_.reset();
  }
  if (hover_ == view) hover_ = nullptr;
  if (capture_ == view) capture_ = nullptr;
}

void Screen::run() {
  using clock = std::chrono::steady_clock;
  render();
  auto last = clock::now();
  while (!quit_) {
    bool ticking = needs_tick_;
    std::optional<InputEvent> ev = term_.read_event(ticking ? config_.tick_interval_ms : -1);
    auto now = clock::now();
    if (ev) {
      const KeyEvent* key = std::get_if<KeyEvent>(&*ev);
      if (key && key->ctrl && key->text == "c") break;
      dispatch(*ev);
    } else if (!ticking) {
      spdlog::info("input closed, leaving run loop");
      break;
    }
    if (ticking) tick(std::chrono::duration<double, std::milli>(now - last).count());
    last = now;
    render();
  }
}
