#include "dropdown.hpp"
#include "unicode.hpp"
#include "viewport.hpp"
#include <algorithm>
#include <iterator>

namespace {
const char* const kUnchecked = "◯ ";
const char* const kChecked = "⦿ ";
const char* const kBoxUnchecked = "☐ ";
const char* const kBoxChecked = "☑ ";
const char* const kSelectAll = "Select all";

std::string repeat(const char* glyph, int n) {
  std::string out;
  for (int i = 0; i < n; ++i) out += glyph;
  return out;
}
}

DropdownSelector::DropdownSelector(std::vector<std::string> choices, std::vector<size_t> selected, bool multiple,
                                   OnSelect on_select, ViewProps props)
  : View(std::move(props)), choices_(std::move(choices)), multiple_(multiple), on_select_(std::move(on_select)) {
  set_selected_rows(selected);
}

std::optional<size_t> DropdownSelector::selected() const {
  if (selected_.empty()) return std::nullopt;
  return *selected_.begin();
}

void DropdownSelector::set_choices(std::vector<std::string> choices) {
  std::vector<std::string> previous;
  for (size_t row : selected_) previous.push_back(choices_[row]);
  choices_ = std::move(choices);
  selected_.clear();
  highlighted_.reset();
  pressed_.reset();
  for (const auto& label : previous) {
    auto it = std::find(choices_.begin(), choices_.end(), label);
    if (it != choices_.end()) selected_.insert(static_cast<size_t>(it - choices_.begin()));
  }
  if (!multiple_ && selected_.size() > 1) selected_.erase(std::next(selected_.begin()), selected_.end());
  invalidate_size();
}

void DropdownSelector::set_selected(std::optional<size_t> row) {
  set_selected_rows(row ? std::vector<size_t>{*row} : std::vector<size_t>{});
}

void DropdownSelector::set_selected_rows(const std::vector<size_t>& rows) {
  selected_.clear();
  for (size_t row : rows) {
    if (row >= choices_.size()) continue;
    selected_.insert(row);
    if (!multiple_) break;
  }
  highlighted_.reset();
  if (auto first = selected()) highlighted_ = row_for(*first);
}

std::optional<size_t> DropdownSelector::choice_for(size_t row) const {
  if (multiple_) {
    if (row == 0) return std::nullopt;
    --row;
  }
  if (row >= choices_.size()) return std::nullopt;
  return row;
}

Size DropdownSelector::do_natural_size(Size) {
  int width = multiple_ ? line_width(kSelectAll) : 0;
  for (const auto& choice : choices_) width = std::max(width, line_width(choice));
  // border on both sides plus the check prefix; border top and bottom
  return Size(width + 4, static_cast<int>(row_count()) + 2);
}

std::optional<size_t> DropdownSelector::row_at(const Point& local) const {
  if (local.x() < 1 || local.x() >= box_.size().width() - 1) return std::nullopt;
  int row = local.y() - 1;
  if (row < 0 || local.y() >= box_.size().height() - 1) return std::nullopt;
  if (row >= static_cast<int>(row_count())) return std::nullopt;
  return static_cast<size_t>(row);
}

void DropdownSelector::activate(size_t row) {
  highlighted_ = row;
  auto choice = choice_for(row);
  if (!multiple_) {
    if (!choice) return;
    selected_ = {*choice};
  } else if (!choice) {
    if (all_selected()) selected_.clear();
    else for (size_t i = 0; i < choices_.size(); ++i) selected_.insert(i);
  } else if (selected_.count(*choice)) {
    selected_.erase(*choice);
  } else {
    selected_.insert(*choice);
  }
  // last statement: the callback may destroy this selector
  OnSelect cb = on_select_;
  if (cb) cb();
}

void DropdownSelector::receive_mouse(const MouseEvent& event) {
  auto row = row_at(event.position);
  if (is_mouse_exit(event)) {
    highlighted_.reset();
    if (auto first = selected()) highlighted_ = row_for(*first);
  } else if (is_mouse_enter(event) || is_mouse_move(event)) {
    if (row) highlighted_ = row;
  } else if (is_mouse_pressed(event)) {
    pressed_ = row;
  } else if (is_mouse_released(event)) {
    bool same = row && row == pressed_;
    pressed_.reset();
    if (same) activate(*row);
  }
}

void DropdownSelector::receive_key(const KeyEvent& event) {
  if (row_count() == 0) return;
  size_t last = row_count() - 1;
  switch (event.key) {
    case Key::Up:
      highlighted_ = highlighted_ && *highlighted_ > 0 ? *highlighted_ - 1 : 0;
      break;
    case Key::Down:
      highlighted_ = highlighted_ ? std::min(last, *highlighted_ + 1) : 0;
      break;
    case Key::Enter:
      if (highlighted_) activate(*highlighted_);
      break;
    default:
      break;
  }
}

void DropdownSelector::do_render(Viewport& viewport) {
  const Size content = viewport.content_size();
  OverlayPlacement overlay = place_overlay(viewport.parent_rect(), natural_size(content), content);
  placement_ = overlay.placement;
  box_ = overlay.rect;

  const Style ui = theme().ui();
  viewport.clipped(box_, ui, [&](Viewport& inside) {
    inside.register_mouse(kMouseButtonLeft | kMouseMove);
    inside.paint(ui);

    const int w = box_.size().width();
    const int h = box_.size().height();
    if (w < 2 || h < 2) return;
    inside.write("╭" + repeat("─", w - 2) + "╮", Point(0, 0));
    inside.write("╰" + repeat("─", w - 2) + "╯", Point(0, h - 1));

    for (int y = 1; y < h - 1; ++y) {
      inside.write("│", Point(0, y));
      inside.write("│", Point(w - 1, y));
      size_t row = static_cast<size_t>(y - 1);
      if (row >= row_count()) continue;

      auto choice = choice_for(row);
      bool is_checked = choice ? selected_.count(*choice) > 0 : all_selected();
      const char* prefix = multiple_ ? (is_checked ? kBoxChecked : kBoxUnchecked) : (is_checked ? kChecked : kUnchecked);
      std::string label = choice ? choices_[*choice] : kSelectAll;
      bool is_selected = choice && is_checked;
      Style row_style = is_selected ? Theme::selected().ui() : theme().ui(ThemeState{false, highlighted_ == row});
      inside.clipped(Rect(1, y, w - 2, 1), row_style, [&](Viewport& cell) {
        cell.paint(row_style);
        cell.write(prefix + label, Point(0, 0));
      });
    }
  });
}

Dropdown::Dropdown(DropdownProps dropdown, ViewProps props)
  : View(std::move(props)),
    on_select_(std::move(dropdown.on_select)),
    on_select_multiple_(std::move(dropdown.on_select_multiple)) {
  if (!dropdown.title.empty()) title_ = split_lines(dropdown.title);
  std::vector<size_t> rows = dropdown.selected_rows;
  if (!dropdown.multiple) {
    rows.clear();
    if (dropdown.selected) rows.push_back(*dropdown.selected);
  }
  selector_ = std::make_unique<DropdownSelector>(std::move(dropdown.choices), rows, dropdown.multiple,
                                                 [this] { did_select(); });
}

void Dropdown::set_selected(std::optional<size_t> row) {
  selector_->set_selected(row);
  invalidate_size();
}

void Dropdown::set_selected_rows(const std::vector<size_t>& rows) {
  selector_->set_selected_rows(rows);
  invalidate_size();
}

void Dropdown::set_choices(std::vector<std::string> choices) {
  selector_->set_choices(std::move(choices));
  invalidate_size();
}

std::vector<std::string> Dropdown::title_lines() const {
  const auto rows = selector_->selected_rows();
  const auto& choices = selector_->choices();
  if (rows.empty()) {
    if (!title_.empty()) return title_;
    return {"<select>"};
  }
  if (rows.size() == 1) return split_lines(choices[rows.front()]);

  // several: one line, labels in row order, newlines flattened
  std::string line;
  for (size_t row : rows) {
    if (!line.empty()) line += ", ";
    std::string label = choices[row];
    std::replace(label.begin(), label.end(), '\n', ' ');
    line += label;
  }
  return {line};
}

void Dropdown::did_select() {
  invalidate_size();
  if (selector_->multiple()) {
    auto cb = on_select_multiple_;
    if (cb) cb(selector_->selected_rows());
    return;
  }

  show_modal_ = false;
  auto row = selector_->selected();
  if (!row) return;
  auto cb = on_select_;
  std::string choice = selector_->choices()[*row];
  // last statement: the callback may remove this dropdown
  if (cb) cb(*row, choice);
}

Size Dropdown::do_natural_size(Size) {
  // 1 left margin, "▏ ▽ " on the right
  return string_size(title_lines()).grow(5, 0);
}

void Dropdown::receive_mouse(const MouseEvent& event) {
  if (is_mouse_enter(event)) is_hover_ = true;
  else if (is_mouse_exit(event)) is_hover_ = false;

  if (is_mouse_clicked(event, content_size())) show_modal_ = true;
}

void Dropdown::do_render(Viewport& viewport) {
  if (show_modal_) {
    selector_->set_theme(theme());
    viewport.request_modal(*selector_, [this] { show_modal_ = false; });
  }

  viewport.register_mouse(kMouseMove | kMouseButtonLeft);
  const auto lines = title_lines();
  const Style style = theme().ui(ThemeState{false, is_hover_ && !show_modal_});
  viewport.paint(style);

  const Size content = viewport.content_size();
  for (int y = 0; y < content.height(); ++y) {
    if (y < static_cast<int>(lines.size())) viewport.write(lines[y], Point(1, y), style);
    viewport.write("▏  ", Point(content.width() - 3, y), style);
  }
  viewport.write(show_modal_ ? "◇" : is_hover_ ? "▼" : "▽", Point(content.width() - 2, content.height() / 2),
                 style);
}
