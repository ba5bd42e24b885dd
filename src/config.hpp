#pragma once
/*
 * Config
 *
 * Purpose: runtime switches that used to be process-wide debug toggles.
 * Usage: built once in main (defaults + ~/.wretchedrc), handed to Screen;
 *        views reach it through screen()->config().
 * Format: one `set` command per line, e.g. `set tickinterval 16`,
 *         `set nomouse`, `set debuglayout on`; # " // start comments.
 */
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct Config {
  bool debug_layout = false;
  bool debug_render = false;
  bool enable_mouse = true;
  int tick_interval_ms = 16;
  std::string log_file;
  std::string log_level = "warn";
};

// Apply one rc line. Returns false and fills msg for unknown or malformed
// settings; blank and comment lines succeed without touching cfg.
bool apply_config_line(std::string_view line, Config& cfg, std::string& msg);

// Apply every line of `path`. Returns false if the file cannot be read;
// bad lines are collected in `errors` and skipped.
bool load_config(const std::filesystem::path& path, Config& cfg, std::string& msg,
                 std::vector<std::string>* errors = nullptr);

// $HOME/.wretchedrc when HOME is set
std::optional<std::filesystem::path> default_config_path();
