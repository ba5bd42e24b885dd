#include "events.hpp"

static MouseInterests interest_for(MouseButton b) {
  switch (b) {
    case MouseButton::Left: return kMouseButtonLeft;
    case MouseButton::Middle: return kMouseButtonMiddle;
    case MouseButton::Right: return kMouseButtonRight;
    case MouseButton::None: break;
  }
  return 0;
}

bool wants_mouse(MouseInterests interests, const MouseEvent& event) {
  switch (event.action) {
    case MouseAction::Enter:
    case MouseAction::Exit:
    case MouseAction::Move:
      return (interests & kMouseMove) != 0;
    case MouseAction::Press:
    case MouseAction::Release:
      return (interests & interest_for(event.button)) != 0;
    case MouseAction::WheelUp:
    case MouseAction::WheelDown:
      return (interests & kMouseWheel) != 0;
  }
  return false;
}

bool is_mouse_enter(const MouseEvent& e) { return e.action == MouseAction::Enter; }
bool is_mouse_exit(const MouseEvent& e) { return e.action == MouseAction::Exit; }
bool is_mouse_move(const MouseEvent& e) { return e.action == MouseAction::Move; }

bool is_mouse_pressed(const MouseEvent& e, MouseButton button) {
  return e.action == MouseAction::Press && e.button == button;
}

bool is_mouse_released(const MouseEvent& e, MouseButton button) {
  return e.action == MouseAction::Release && e.button == button;
}

bool is_mouse_clicked(const MouseEvent& e, const Size& content, MouseButton button) {
  return is_mouse_released(e, button) && Rect(Point::zero(), content).contains(e.position);
}

const char* to_string(MouseAction action) {
  switch (action) {
    case MouseAction::Enter: return "enter";
    case MouseAction::Exit: return "exit";
    case MouseAction::Move: return "move";
    case MouseAction::Press: return "press";
    case MouseAction::Release: return "release";
    case MouseAction::WheelUp: return "wheel-up";
    case MouseAction::WheelDown: return "wheel-down";
  }
  return "?";
}
