#include "accordion.hpp"
#include "collapsible.hpp"
#include "config.hpp"
#include "dropdown.hpp"
#include "inspect.hpp"
#include "log.hpp"
#include "ncurses_terminal.hpp"
#include "screen.hpp"
#include "stack.hpp"
#include "terminal.hpp"
#include "text.hpp"
#include <spdlog/spdlog.h>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

static std::unique_ptr<View> build_demo() {
  auto root = std::make_unique<Stack>(Stack::Direction::TopToBottom, ViewProps{.padding = Edges::all(1)});

  Style heading;
  heading.bold = true;
  root->add(std::make_unique<Text>(TextProps{"wretched demo  (Ctrl-C quits)", heading}));
  root->add(std::make_unique<Text>(
    TextProps{"Views size themselves, render into clipped viewports, and \x1b[1mbold\x1b[22m or \x1b[4munderlined\x1b[24m "
              "runs come from inline SGR codes.",
              std::nullopt, Alignment::Left, true}));

  auto status = std::make_unique<Text>(TextProps{"nothing selected yet"});
  Text* status_view = status.get();

  root->add(std::make_unique<Collapsible>(
    std::make_unique<Text>(TextProps{"Details (click to expand)"}),
    std::make_unique<Text>(TextProps{"Details\n  clicks toggle this view\n  hover changes its colour"})));

  auto accordion = std::make_unique<Accordion>();
  accordion->add_section("First section", std::make_unique<Text>(TextProps{"Sections slide open\nover a few ticks."}));
  accordion->add_section("Second section", std::make_unique<Text>(TextProps{"Opening one closes the others."}));
  accordion->add_section("Third section", std::make_unique<Text>(TextProps{"Line 1\nLine 2\nLine 3"}));
  root->add(std::move(accordion));

  DropdownProps dropdown;
  dropdown.title = "Pick a colour";
  dropdown.choices = {"Red", "Green", "Blue", "Magenta"};
  dropdown.on_select = [status_view](size_t, const std::string& choice) {
    status_view->set_text("selected: " + choice);
  };
  root->add(std::make_unique<Dropdown>(std::move(dropdown), ViewProps{.width = 24}));

  DropdownProps toppings;
  toppings.title = "Toppings";
  toppings.choices = {"Cheese", "Olives", "Basil"};
  toppings.multiple = true;
  toppings.on_select_multiple = [status_view](const std::vector<size_t>& rows) {
    status_view->set_text(std::to_string(rows.size()) + " topping(s) picked");
  };
  root->add(std::make_unique<Dropdown>(std::move(toppings), ViewProps{.width = 24}));
  root->add(std::move(status));
  return root;
}

int main(int argc, char** argv) {
  Config cfg;
  std::vector<std::string> errors;
  std::string msg;
  std::optional<std::filesystem::path> rc;
  if (argc >= 2) rc = std::filesystem::path(argv[1]);
  else rc = default_config_path();
  bool rc_loaded = false;
  if (rc && std::filesystem::exists(*rc)) {
    rc_loaded = load_config(*rc, cfg, msg, &errors);
    if (!rc_loaded) std::fprintf(stderr, "%s\n", msg.c_str());
  }

  std::string log_msg;
  if (!init_logging(cfg, true, log_msg)) std::fprintf(stderr, "%s\n", log_msg.c_str());
  if (rc_loaded) spdlog::info("loaded {}", rc->string());
  for (const auto& e : errors) spdlog::warn("config: {}", e);

  Terminal term(cfg.enable_mouse);
  NcursesTerminal nterm;
  Screen screen(nterm, cfg);
  screen.set_root(build_demo());
  screen.run();
  if (cfg.debug_layout) spdlog::debug("final tree:\n{}", describe_tree(*screen.root()));
  return 0;
}
