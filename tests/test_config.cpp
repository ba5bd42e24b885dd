#include "config.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

static void test_lines() {
  Config cfg;
  std::string msg;
  assert(cfg.enable_mouse);
  assert(apply_config_line("set nomouse", cfg, msg));
  assert(!cfg.enable_mouse);
  assert(apply_config_line(":set mouse", cfg, msg));
  assert(cfg.enable_mouse);

  assert(apply_config_line("set debuglayout on", cfg, msg));
  assert(cfg.debug_layout);
  assert(apply_config_line("  set debuglayout=off  ", cfg, msg));
  assert(!cfg.debug_layout);
  assert(apply_config_line("set debugrender", cfg, msg));
  assert(cfg.debug_render);

  assert(apply_config_line("set tickinterval 33", cfg, msg));
  assert(cfg.tick_interval_ms == 33);
  assert(!apply_config_line("set tickinterval 0", cfg, msg));
  assert(!apply_config_line("set tickinterval fast", cfg, msg));
  assert(cfg.tick_interval_ms == 33);

  assert(apply_config_line("set loglevel debug", cfg, msg));
  assert(cfg.log_level == "debug");
  msg.clear();
  assert(!apply_config_line("set loglevel loud", cfg, msg));
  assert(msg.find("loud") != std::string::npos);

  assert(apply_config_line("set logfile /tmp/wretched.log", cfg, msg));
  assert(cfg.log_file == "/tmp/wretched.log");

  assert(apply_config_line("# comment", cfg, msg));
  assert(apply_config_line("\" vim style comment", cfg, msg));
  assert(apply_config_line("// comment", cfg, msg));
  assert(apply_config_line("", cfg, msg));

  msg.clear();
  assert(!apply_config_line("set colour red", cfg, msg));
  assert(msg.find("unknown command") == 0);
  assert(!apply_config_line("set debuglayout maybe", cfg, msg));
}

static void test_file() {
  auto path = std::filesystem::temp_directory_path() / "wretched_test_config.rc";
  {
    std::ofstream out(path);
    out << "# settings\r\n";
    out << "set tickinterval 20\n";
    out << "set bogus 1\n";
    out << "set nomouse\n";
  }
  Config cfg;
  std::string msg;
  std::vector<std::string> errors;
  assert(load_config(path, cfg, msg, &errors));
  assert(cfg.tick_interval_ms == 20);
  assert(!cfg.enable_mouse);
  assert(errors.size() == 1);
  assert(errors[0].find(":3:") != std::string::npos);
  std::filesystem::remove(path);

  Config missing;
  msg.clear();
  assert(!load_config(path, missing, msg));
  assert(!msg.empty());
}

int main() {
  test_lines();
  test_file();
  return 0;
}
