#include "config.hpp"
#include "cmd_registry.hpp"
#include "file_reader.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

static std::string trim(std::string_view s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return std::string(s.substr(i, j - i));
}

static bool parse_bool(const std::vector<std::string>& args, bool& out, std::string& msg, const std::string& name) {
  if (args.empty()) { out = true; return true; }
  const std::string& v = args[0];
  if (v == "on" || v == "1" || v == "true") { out = true; return true; }
  if (v == "off" || v == "0" || v == "false") { out = false; return true; }
  msg = "set " + name + ": value must be on|off";
  return false;
}

static void register_bool(CommandRegistry& reg, const std::string& name, bool& field) {
  reg.register_command("set " + name, [&field, name](const std::vector<std::string>& args, std::string& msg) {
    return parse_bool(args, field, msg, name);
  });
}

static CommandRegistry make_registry(Config& cfg) {
  CommandRegistry reg;
  register_bool(reg, "mouse", cfg.enable_mouse);
  register_bool(reg, "debuglayout", cfg.debug_layout);
  register_bool(reg, "debugrender", cfg.debug_render);
  reg.register_command("set tickinterval", [&cfg](const std::vector<std::string>& args, std::string& msg) {
    if (args.empty()) { msg = "set tickinterval: use set tickinterval <ms>"; return false; }
    const std::string& s = args[0];
    bool ok = !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
    if (!ok || s.size() > 6) { msg = "set tickinterval: interval must be a number"; return false; }
    int ms = std::stoi(s);
    if (ms < 1) { msg = "set tickinterval: interval must be >= 1"; return false; }
    cfg.tick_interval_ms = ms;
    return true;
  });
  reg.register_command("set logfile", [&cfg](const std::vector<std::string>& args, std::string& msg) {
    if (args.empty()) { msg = "set logfile: use set logfile <path>"; return false; }
    cfg.log_file = args[0];
    return true;
  });
  reg.register_command("set loglevel", [&cfg](const std::vector<std::string>& args, std::string& msg) {
    static const char* levels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    if (args.empty()) { msg = "set loglevel: use set loglevel trace|debug|info|warn|error|critical|off"; return false; }
    for (const char* l : levels) {
      if (args[0] == l) { cfg.log_level = args[0]; return true; }
    }
    msg = "set loglevel: unknown level " + args[0];
    return false;
  });
  return reg;
}

static bool apply_line(std::string_view raw, const CommandRegistry& reg, std::string& msg) {
  std::string s = trim(raw);
  if (s.empty()) return true;
  if (s[0] == '#' || s[0] == '"') return true;
  if (s.size() >= 2 && s[0] == '/' && s[1] == '/') return true;
  if (s[0] == ':') s.erase(s.begin());

  // "set key=value" is accepted as "set key value"
  std::replace(s.begin(), s.end(), '=', ' ');
  std::istringstream iss(s);
  std::vector<std::string> words;
  for (std::string w; iss >> w;) words.push_back(w);
  if (words.size() < 2) { msg = "unknown command: " + s; return false; }

  std::string name = words[0] + " " + words[1];
  std::vector<std::string> args(words.begin() + 2, words.end());
  if (!reg.has(name) && words[1].rfind("no", 0) == 0 && reg.has(words[0] + " " + words[1].substr(2))) {
    name = words[0] + " " + words[1].substr(2);
    args = {"off"};
  }
  return reg.execute(name, args, msg);
}

bool apply_config_line(std::string_view line, Config& cfg, std::string& msg) {
  CommandRegistry reg = make_registry(cfg);
  return apply_line(line, reg, msg);
}

bool load_config(const std::filesystem::path& path, Config& cfg, std::string& msg,
                 std::vector<std::string>* errors) {
  std::vector<std::string> lines;
  if (!read_lines(path, lines, msg)) return false;
  CommandRegistry reg = make_registry(cfg);
  for (size_t i = 0; i < lines.size(); ++i) {
    std::string err;
    if (!apply_line(lines[i], reg, err) && errors) {
      errors->push_back(path.filename().string() + ":" + std::to_string(i + 1) + ": " + err);
    }
  }
  return true;
}

std::optional<std::filesystem::path> default_config_path() {
  const char* home = std::getenv("HOME");
  if (!home) return std::nullopt;
  return std::filesystem::path(home) / ".wretchedrc";
}
