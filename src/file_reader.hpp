#pragma once
#include <filesystem>
#include <string>
#include <vector>

bool read_lines(const std::filesystem::path& path,
                std::vector<std::string>& out_lines,
                std::string& msg);
