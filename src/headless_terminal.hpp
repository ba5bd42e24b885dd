#pragma once
#include <deque>
#include "canvas.hpp"
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  explicit HeadlessTerminal(TermSize size = {24, 80});

  TermSize get_size() const override { return size_; }
  void clear_screen() override;
  void draw_cell(int row, int col, const std::string& glyph, const Style& style) override;
  void flush() override { flush_count_++; }
  std::optional<InputEvent> read_event(int timeout_ms) override;

  void set_size(TermSize size);
  void push_event(InputEvent event) { events_.push_back(std::move(event)); }
  const Canvas& screen() const { return screen_; }
  std::string row_text(int row) const { return screen_.row_text(row); }
  int flush_count() const { return flush_count_; }
  size_t pending() const { return events_.size(); }
  // number of read_event calls that timed out (empty queue, timeout >= 0)
  int timeouts() const { return timeouts_; }

private:
  TermSize size_;
  Canvas screen_;
  std::deque<InputEvent> events_;
  int flush_count_ = 0;
  int timeouts_ = 0;
};
