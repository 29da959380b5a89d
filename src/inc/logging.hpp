#pragma once

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace weasel {

inline constexpr auto logger_name = "weasel";

inline void setup_logging(bool verbose) {
  auto logger = spdlog::get(logger_name);
  if (!logger) {
    logger = spdlog::stderr_color_mt(logger_name);
  }

  logger->set_pattern("%^%l%$: %v");
  logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);

  spdlog::set_default_logger(logger);
}

} // namespace weasel
