/**
 * @file Logging.cpp
 * @brief spdlog logger construction.
 */

#include "src/logging/inc/Logging.hpp"

#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace pfrelay {

namespace logging {

bool parseLevel(std::string_view text, spdlog::level::level_enum& level) noexcept {
  static constexpr struct {
    std::string_view name;
    spdlog::level::level_enum level;
  } LEVELS[] = {
      {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
      {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
      {"error", spdlog::level::err},
  };

  for (const auto& ENTRY : LEVELS) {
    if (ENTRY.name == text) {
      level = ENTRY.level;
      return true;
    }
  }
  return false;
}

std::shared_ptr<spdlog::logger> makeStdoutLogger(spdlog::level::level_enum level) {
  auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto log = std::make_shared<spdlog::logger>(LOGGER_NAME, std::move(sink));
  log->set_pattern(LOG_PATTERN);
  log->set_level(level);
  // Warnings and errors reach the terminal/journal even if the process dies next
  log->flush_on(spdlog::level::warn);
  return log;
}

} // namespace logging

} // namespace pfrelay
