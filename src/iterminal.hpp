#pragma once
#include <optional>
#include <string>
#include "events.hpp"
#include "style.hpp"

struct TermSize { int rows; int cols; };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize get_size() const = 0;
  virtual void clear_screen() = 0;
  virtual void draw_cell(int row, int col, const std::string& glyph, const Style& style) = 0;
  virtual void flush() = 0;
  // timeout_ms < 0 blocks; std::nullopt on timeout
  virtual std::optional<InputEvent> read_event(int timeout_ms) = 0;
};
