#include "log.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>

bool init_logging(const Config& cfg, bool interactive, std::string& msg) {
  std::shared_ptr<spdlog::logger> logger;
  bool ok = true;
  if (!cfg.log_file.empty()) {
    try {
      logger = std::make_shared<spdlog::logger>(
        "wretched", std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.log_file, true));
    } catch (const spdlog::spdlog_ex& ex) {
      msg = std::string("can not open log file: ") + ex.what();
      ok = false;
    }
  } else if (!interactive) {
    logger = std::make_shared<spdlog::logger>("wretched", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  if (!logger) logger = std::make_shared<spdlog::logger>("wretched", std::make_shared<spdlog::sinks::null_sink_mt>());

  logger->set_level(spdlog::level::from_str(cfg.log_level));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);
  return ok;
}
