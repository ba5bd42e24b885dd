#pragma once
/*
 * Logging
 *
 * Purpose: route spdlog's default logger according to Config.
 * Note: while ncurses owns the terminal, stdout/stderr logging would corrupt
 *       the screen, so the interactive app logs to Config::log_file or not at all.
 */
#include "config.hpp"

// Returns false and fills msg if the log file cannot be opened; the default
// logger is left as a null sink in that case.
bool init_logging(const Config& cfg, bool interactive, std::string& msg);
