#pragma once
/*
 * Input
 *
 * Purpose: turn raw getch() codes into KeyEvents with minimal state.
 * Note: multi-byte UTF-8 arrives one byte per getch(); bytes are buffered
 *       until the code point is complete.
 */
#include <optional>
#include <string>
#include "events.hpp"

class Input {
public:
  std::optional<KeyEvent> consume(int ch);
  bool pending() const { return utf8_expected_ > 0; }
  void reset();
private:
  std::string utf8_;
  size_t utf8_expected_ = 0;
};
