#pragma once
/*
 * Dropdown / DropdownSelector
 *
 * Purpose: a choice picker, single or multiple. The Dropdown shows the title
 *   (or the selected choices) and, when clicked, asks the screen to show its
 *   DropdownSelector as a modal popover anchored below or above it.
 * Ownership: the Dropdown owns its selector; the selector is never part of
 *   the view tree, it is only rendered by the modal pass.
 */
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "overlay.hpp"
#include "view.hpp"

class DropdownSelector : public View {
public:
  using OnSelect = std::function<void()>;

  DropdownSelector(std::vector<std::string> choices, std::vector<size_t> selected, bool multiple,
                   OnSelect on_select, ViewProps props = {});

  const std::vector<std::string>& choices() const { return choices_; }
  void set_choices(std::vector<std::string> choices);
  bool multiple() const { return multiple_; }
  // lowest selected row
  std::optional<size_t> selected() const;
  std::vector<size_t> selected_rows() const { return {selected_.begin(), selected_.end()}; }
  void set_selected(std::optional<size_t> row);
  void set_selected_rows(const std::vector<size_t>& rows);
  bool all_selected() const { return !choices_.empty() && selected_.size() == choices_.size(); }
  // highlighted list row; in multiple mode row 0 is "Select all"
  std::optional<size_t> highlighted() const { return highlighted_; }
  // placement chosen by the last render
  Placement placement() const { return placement_; }
  const Rect& box() const { return box_; }

  void receive_mouse(const MouseEvent& event) override;
  void receive_key(const KeyEvent& event) override;
  const char* type_name() const override { return "DropdownSelector"; }

protected:
  Size do_natural_size(Size available) override;
  void do_render(Viewport& viewport) override;

private:
  size_t row_count() const { return choices_.size() + (multiple_ ? 1 : 0); }
  std::optional<size_t> choice_for(size_t row) const;
  size_t row_for(size_t choice) const { return choice + (multiple_ ? 1 : 0); }
  std::optional<size_t> row_at(const Point& local) const;
  void activate(size_t row);

  std::vector<std::string> choices_;
  std::set<size_t> selected_;
  bool multiple_;
  std::optional<size_t> highlighted_;
  std::optional<size_t> pressed_;
  OnSelect on_select_;
  Placement placement_ = Placement::Below;
  Rect box_;
};

struct DropdownProps {
  std::string title;
  std::vector<std::string> choices;
  // single mode
  std::optional<size_t> selected;
  std::function<void(size_t, const std::string&)> on_select;
  // multiple mode: rows toggle, the popover stays open
  bool multiple = false;
  std::vector<size_t> selected_rows;
  std::function<void(const std::vector<size_t>&)> on_select_multiple;
};

class Dropdown : public View {
public:
  explicit Dropdown(DropdownProps dropdown, ViewProps props = {});

  bool multiple() const { return selector_->multiple(); }
  std::optional<size_t> selected() const { return selector_->selected(); }
  std::vector<size_t> selected_rows() const { return selector_->selected_rows(); }
  void set_selected(std::optional<size_t> row);
  void set_selected_rows(const std::vector<size_t>& rows);
  const std::vector<std::string>& choices() const { return selector_->choices(); }
  void set_choices(std::vector<std::string> choices);
  bool is_open() const { return show_modal_; }
  void dismiss_modal() { show_modal_ = false; }
  DropdownSelector& selector() { return *selector_; }

  void receive_mouse(const MouseEvent& event) override;
  const char* type_name() const override { return "Dropdown"; }

protected:
  Size do_natural_size(Size available) override;
  void do_render(Viewport& viewport) override;

private:
  std::vector<std::string> title_lines() const;
  void did_select();

  std::vector<std::string> title_;
  std::function<void(size_t, const std::string&)> on_select_;
  std::function<void(const std::vector<size_t>&)> on_select_multiple_;
  std::unique_ptr<DropdownSelector> selector_;
  bool is_hover_ = false;
  bool show_modal_ = false;
};
