#pragma once
/*
 * Events
 *
 * Purpose: mouse/key/resize values flowing from the terminal to the view tree.
 * Note: mouse positions are absolute when they leave the terminal and local
 *       (relative to the receiving view's content origin) when delivered.
 *       "Click" is not an event; a view pairs Press/Release itself.
 */
#include <string>
#include <variant>
#include "geometry.hpp"

enum class MouseButton { None, Left, Middle, Right };
enum class MouseAction { Enter, Exit, Move, Press, Release, WheelUp, WheelDown };

struct MouseEvent {
  MouseAction action = MouseAction::Move;
  MouseButton button = MouseButton::None;
  Point position;
};

// bit flags passed to Viewport::register_mouse
using MouseInterests = unsigned;
constexpr MouseInterests kMouseMove = 1u << 0;
constexpr MouseInterests kMouseButtonLeft = 1u << 1;
constexpr MouseInterests kMouseButtonMiddle = 1u << 2;
constexpr MouseInterests kMouseButtonRight = 1u << 3;
constexpr MouseInterests kMouseWheel = 1u << 4;

bool wants_mouse(MouseInterests interests, const MouseEvent& event);

bool is_mouse_enter(const MouseEvent& e);
bool is_mouse_exit(const MouseEvent& e);
bool is_mouse_move(const MouseEvent& e);
bool is_mouse_pressed(const MouseEvent& e, MouseButton button = MouseButton::Left);
bool is_mouse_released(const MouseEvent& e, MouseButton button = MouseButton::Left);
// a release that lands inside the view's content area
bool is_mouse_clicked(const MouseEvent& e, const Size& content, MouseButton button = MouseButton::Left);

enum class Key {
  Char, Enter, Escape, Tab, Backspace, Delete,
  Up, Down, Left, Right, Home, End, PageUp, PageDown,
  F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,
  Unknown
};

struct KeyEvent {
  Key key = Key::Unknown;
  std::string text; // UTF-8 payload when key == Key::Char
  bool ctrl = false;
  bool alt = false;
  bool shift = false;
};

struct ResizeEvent {
  Size size;
};

using InputEvent = std::variant<KeyEvent, MouseEvent, ResizeEvent>;

const char* to_string(MouseAction action);
