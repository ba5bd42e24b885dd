#include "unicode.hpp"
#include <cassert>
#include <string>

int main() {
  assert(line_width("hello") == 5);
  assert(line_width("日本") == 4);
  assert(char_width("日") == 2);
  assert(char_width("►") == 1);
  assert(char_width("\x1b[1m") == 0);

  auto chars = printable_chars("a\x1b[1mb");
  assert(chars.size() == 3);
  assert(chars[1] == "\x1b[1m");
  assert(line_width("a\x1b[1mb\x1b[0m") == 2);

  // e + combining acute is a single one-cell glyph
  auto combined = printable_chars("e\xcc\x81x");
  assert(combined.size() == 2);
  assert(char_width(combined[0]) == 1);

  auto lines = split_lines("one\ntwo\n");
  assert(lines.size() == 3);
  assert(lines[2].empty());
  assert(string_size({"ab", "abcd", ""}) == Size(4, 3));

  assert(left_pad("ab", 4) == "  ab");
  assert(right_pad("ab", 4) == "ab  ");
  assert(center_pad("ab", 5) == " ab  ");
  assert(right_pad("abcdef", 3) == "abcdef");
  return 0;
}
