#pragma once
#include <memory>
#include "container.hpp"

class Collapsible : public Container {
public:
  Collapsible(std::unique_ptr<View> collapsed, std::unique_ptr<View> expanded, bool is_collapsed = true,
              ViewProps props = {});

  bool is_collapsed() const { return is_collapsed_; }
  void set_collapsed(bool collapsed);
  bool is_hover() const { return is_hover_; }
  bool is_pressed() const { return is_pressed_; }

  void receive_mouse(const MouseEvent& event) override;
  const char* type_name() const override { return "Collapsible"; }

protected:
  Size do_natural_size(Size available) override;
  void do_render(Viewport& viewport) override;

private:
  View* current() const { return is_collapsed_ ? collapsed_ : expanded_; }

  View* collapsed_;
  View* expanded_;
  bool is_collapsed_;
  bool is_pressed_ = false;
  bool is_hover_ = false;
};
