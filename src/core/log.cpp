#include "core/log.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <vector>

namespace conductor {

void init_logging(const Config& config, bool console) {
  std::vector<spdlog::sink_ptr> sinks;

  if (console) {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }

  if (config.log_file) {
    try {
      std::filesystem::path path(*config.log_file);
      if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
      }
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path.string(), 5 * 1024 * 1024, 3));
    } catch (const spdlog::spdlog_ex& e) {
      spdlog::error("[Log] Cannot open log file {}: {}", *config.log_file, e.what());
    } catch (const std::filesystem::filesystem_error& e) {
      spdlog::error("[Log] Cannot create log directory for {}: {}", *config.log_file, e.what());
    }
  }

  auto logger = std::make_shared<spdlog::logger>("conductor", sinks.begin(), sinks.end());
  logger->set_level(spdlog::level::from_str(config.log_level));
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);
}

}  // namespace conductor
