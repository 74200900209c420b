// src/app/logging.hpp
// spdlog setup: diagnostics go to stderr so stdout stays clean for previews
// and beat output.

#pragma once
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace app {

inline void init_logging(bool verbose) {
  auto logger = spdlog::stderr_color_mt("midicap");
  logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
  logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
  spdlog::set_default_logger(logger);
}

} // namespace app
