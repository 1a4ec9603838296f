#ifndef PFRELAY_LOGGING_LOGGING_HPP
#define PFRELAY_LOGGING_LOGGING_HPP
/**
 * @file Logging.hpp
 * @brief Logger construction for the daemon.
 *
 * The core never looks loggers up by name; the daemon builds one here and
 * passes the shared_ptr into the registry and event source.
 */

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/common.h>
#include <spdlog/logger.h>

namespace pfrelay {

namespace logging {

/* ----------------------------- Constants ----------------------------- */

/// Logger name shown in every line.
inline constexpr const char* LOGGER_NAME = "pf-status-relay";

/// Line layout: timestamp, level, then the message with its key=value context.
inline constexpr const char* LOG_PATTERN = "%Y-%m-%dT%H:%M:%S.%e%z %^%-5l%$ %v";

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse a level name.
 * @param text One of trace, debug, info, warn, error.
 * @param level Parsed level on success.
 * @return false for any other text.
 */
[[nodiscard]] bool parseLevel(std::string_view text, spdlog::level::level_enum& level) noexcept;

/**
 * @brief Build the daemon logger writing to stdout.
 * @param level Minimum level to emit.
 * @note Thread-safe sink; monitors on different threads share it.
 */
[[nodiscard]] std::shared_ptr<spdlog::logger> makeStdoutLogger(spdlog::level::level_enum level);

} // namespace logging

} // namespace pfrelay

#endif // PFRELAY_LOGGING_LOGGING_HPP
