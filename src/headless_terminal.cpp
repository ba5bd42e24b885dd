#include "headless_terminal.hpp"

HeadlessTerminal::HeadlessTerminal(TermSize size) : size_(size), screen_(Size(size.cols, size.rows)) {}

void HeadlessTerminal::set_size(TermSize size) {
  size_ = size;
  screen_.resize(Size(size.cols, size.rows));
}

void HeadlessTerminal::clear_screen() { screen_.clear(); }

void HeadlessTerminal::draw_cell(int row, int col, const std::string& glyph, const Style& style) {
  screen_.set(Point(col, row), glyph, style);
}

std::optional<InputEvent> HeadlessTerminal::read_event(int timeout_ms) {
  if (events_.empty()) {
    if (timeout_ms >= 0) timeouts_++;
    return std::nullopt;
  }
  InputEvent ev = std::move(events_.front());
  events_.pop_front();
  return ev;
}
