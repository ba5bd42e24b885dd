#pragma once
/*
 * Accordion / AccordionSection
 *
 * Purpose: stacked sections whose bodies slide open and closed.
 * Animation: a section registers for ticks while its visible body height
 *   differs from the target (open: full body height, closed: 0) and moves
 *   dt/25 rows per tick toward it.
 * Policy: unless `multiple`, opening one section closes the others.
 */
#include <functional>
#include <memory>
#include <string>
#include "container.hpp"

class Text;

class AccordionSection : public Container {
public:
  using OnClick = std::function<void(AccordionSection&, bool)>;

  AccordionSection(const std::string& title, std::unique_ptr<View> view, bool is_open = false,
                   ViewProps props = {});

  bool is_open() const { return is_open_; }
  void set_open(bool open);
  void open() { set_open(true); }
  void close() { set_open(false); }
  const std::string& title() const;
  void set_title(const std::string& title);
  void set_on_click(OnClick fn) { on_click_ = std::move(fn); }
  bool is_animating() const;
  double current_view_height() const { return current_view_height_; }

  void receive_mouse(const MouseEvent& event) override;
  bool receive_tick(double dt_ms) override;
  const char* type_name() const override { return "AccordionSection"; }

protected:
  Size do_natural_size(Size available) override;
  void do_render(Viewport& viewport) override;

private:
  Style title_style() const;
  Size current_size(Size collapsed, Size view);

  Text* title_;
  View* view_;
  bool is_open_;
  bool is_hover_ = false;
  double current_view_height_ = 0;
  int actual_view_height_ = 0;
  int title_height_ = 1;
  OnClick on_click_;
};

class Accordion : public Container {
public:
  explicit Accordion(bool multiple = false, ViewProps props = {}) : Container(std::move(props)), multiple_(multiple) {}

  AccordionSection* add_section(const std::string& title, std::unique_ptr<View> view, bool is_open = false);
  AccordionSection* add_section(std::unique_ptr<AccordionSection> section);
  std::vector<AccordionSection*> sections() const;
  const char* type_name() const override { return "Accordion"; }

protected:
  Size do_natural_size(Size available) override;
  void do_render(Viewport& viewport) override;

private:
  void section_did_change(AccordionSection& section, bool is_open);
  bool multiple_;
};
