#include "file_reader.hpp"
#include <fstream>

bool read_lines(const std::filesystem::path& path,
                std::vector<std::string>& out_lines,
                std::string& msg) {
  out_lines.clear();
  std::ifstream in(path, std::ios::binary);
  if (!in) { msg = std::string("can not open file: ") + path.string(); return false; }
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    out_lines.push_back(std::move(line));
  }
  if (in.bad()) { msg = std::string("can not read file: ") + path.string(); return false; }
  msg = std::string("read ") + path.string();
  return true;
}
