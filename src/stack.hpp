#pragma once
#include "container.hpp"

class Stack : public Container {
public:
  enum class Direction { TopToBottom, LeftToRight };

  explicit Stack(Direction direction = Direction::TopToBottom, ViewProps props = {})
    : Container(std::move(props)), direction_(direction) {}

  Direction direction() const { return direction_; }
  void set_direction(Direction d);
  const char* type_name() const override { return "Stack"; }

protected:
  Size do_natural_size(Size available) override;
  void do_render(Viewport& viewport) override;

private:
  Direction direction_;
};
