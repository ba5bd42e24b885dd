#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing and input.
 * Note: initialization/teardown is managed by the Terminal RAII wrapper.
 *       Colour pairs are allocated lazily per (fg, bg) combination.
 */
#include <map>
#include <utility>
#include "input.hpp"
#include "iterminal.hpp"

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  ~NcursesTerminal() override = default;
  TermSize get_size() const override;
  void clear_screen() override;
  void draw_cell(int row, int col, const std::string& glyph, const Style& style) override;
  void flush() override;
  std::optional<InputEvent> read_event(int timeout_ms) override;

private:
  int pair_for(int fg, int bg);
  bool colors_ = false;
  std::map<std::pair<int, int>, int> pairs_;
  int next_pair_ = 1;
  Input input_;
};
