#pragma once
/*
 * Unicode
 *
 * Purpose: split UTF-8 lines into printable units and measure terminal cells.
 * Note: SGR escape tokens (ESC [ ... m) come back as their own zero-width
 *       units so callers can feed them to a pen while walking the line.
 */
#include <string>
#include <string_view>
#include <vector>
#include "geometry.hpp"

std::vector<std::string> printable_chars(std::string_view line);
int char_width(std::string_view ch);
int line_width(std::string_view line);
// widest line x number of lines
Size string_size(const std::vector<std::string>& lines);
std::vector<std::string> split_lines(std::string_view text);

std::string left_pad(std::string_view str, int length);
std::string right_pad(std::string_view str, int length);
std::string center_pad(std::string_view str, int length);
