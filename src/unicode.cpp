#include "unicode.hpp"
#include "style.hpp"
#include <algorithm>
#include <utility>

static size_t utf8_length(unsigned char lead) {
  if (lead < 0x80) return 1;
  if ((lead >> 5) == 0x6) return 2;
  if ((lead >> 4) == 0xE) return 3;
  if ((lead >> 3) == 0x1E) return 4;
  return 1;
}

static char32_t decode(std::string_view ch) {
  if (ch.empty()) return 0;
  unsigned char c0 = static_cast<unsigned char>(ch[0]);
  size_t n = std::min(utf8_length(c0), ch.size());
  if (n == 1) return c0;
  char32_t cp = c0 & (0xFF >> (n + 1));
  for (size_t i = 1; i < n; ++i) cp = (cp << 6) | (static_cast<unsigned char>(ch[i]) & 0x3F);
  return cp;
}

static bool in_ranges(char32_t cp, const std::pair<char32_t, char32_t>* ranges, size_t count) {
  for (size_t i = 0; i < count; ++i) {
    if (cp >= ranges[i].first && cp <= ranges[i].second) return true;
  }
  return false;
}

static bool is_zero_width(char32_t cp) {
  static const std::pair<char32_t, char32_t> ranges[] = {
    {0x0300, 0x036F}, {0x0483, 0x0489}, {0x0591, 0x05BD}, {0x0610, 0x061A},
    {0x064B, 0x065F}, {0x200B, 0x200F}, {0x202A, 0x202E}, {0x2060, 0x2064},
    {0x20D0, 0x20FF}, {0xFE00, 0xFE0F}, {0xFE20, 0xFE2F}, {0xFEFF, 0xFEFF},
  };
  return in_ranges(cp, ranges, sizeof(ranges) / sizeof(ranges[0]));
}

static bool is_wide(char32_t cp) {
  static const std::pair<char32_t, char32_t> ranges[] = {
    {0x1100, 0x115F}, {0x2E80, 0x303E}, {0x3041, 0x33FF}, {0x3400, 0x4DBF},
    {0x4E00, 0x9FFF}, {0xA000, 0xA4CF}, {0xAC00, 0xD7A3}, {0xF900, 0xFAFF},
    {0xFE30, 0xFE4F}, {0xFF00, 0xFF60}, {0xFFE0, 0xFFE6}, {0x1F300, 0x1F64F},
    {0x1F900, 0x1F9FF}, {0x20000, 0x3FFFD},
  };
  return in_ranges(cp, ranges, sizeof(ranges) / sizeof(ranges[0]));
}

std::vector<std::string> printable_chars(std::string_view line) {
  std::vector<std::string> out;
  size_t i = 0;
  while (i < line.size()) {
    if (line[i] == '\x1b' && i + 1 < line.size() && line[i + 1] == '[') {
      size_t j = i + 2;
      while (j < line.size() && !(line[j] >= 0x40 && line[j] <= 0x7E)) j++;
      size_t end = std::min(j + 1, line.size());
      out.emplace_back(line.substr(i, end - i));
      i = end;
      continue;
    }
    size_t n = std::min(utf8_length(static_cast<unsigned char>(line[i])), line.size() - i);
    std::string_view ch = line.substr(i, n);
    // combining marks ride along with the previous glyph
    if (!out.empty() && !Style::is_sgr(out.back()) && is_zero_width(decode(ch))) out.back().append(ch);
    else out.emplace_back(ch);
    i += n;
  }
  return out;
}

int char_width(std::string_view ch) {
  if (ch.empty() || ch[0] == '\x1b') return 0;
  char32_t cp = decode(ch);
  if (cp < 0x20 || (cp >= 0x7F && cp < 0xA0)) return 0;
  if (is_zero_width(cp)) return 0;
  return is_wide(cp) ? 2 : 1;
}

int line_width(std::string_view line) {
  int w = 0;
  for (const auto& ch : printable_chars(line)) w += char_width(ch);
  return w;
}

Size string_size(const std::vector<std::string>& lines) {
  int w = 0;
  for (const auto& l : lines) w = std::max(w, line_width(l));
  return Size(w, static_cast<int>(lines.size()));
}

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (true) {
    size_t nl = text.find('\n', start);
    if (nl == std::string_view::npos) { lines.emplace_back(text.substr(start)); break; }
    lines.emplace_back(text.substr(start, nl - start));
    start = nl + 1;
  }
  return lines;
}

std::string left_pad(std::string_view str, int length) {
  int w = line_width(str);
  if (w >= length) return std::string(str);
  return std::string(length - w, ' ') + std::string(str);
}

std::string right_pad(std::string_view str, int length) {
  int w = line_width(str);
  if (w >= length) return std::string(str);
  return std::string(str) + std::string(length - w, ' ');
}

std::string center_pad(std::string_view str, int length) {
  int w = line_width(str);
  if (w >= length) return std::string(str);
  int left = (length - w) / 2;
  int right = length - w - left;
  return std::string(left, ' ') + std::string(str) + std::string(right, ' ');
}
