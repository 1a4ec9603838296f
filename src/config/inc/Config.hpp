#ifndef PFRELAY_CONFIG_CONFIG_HPP
#define PFRELAY_CONFIG_CONFIG_HPP
/**
 * @file Config.hpp
 * @brief Daemon configuration file.
 *
 * YAML document:
 * @code
 * interfaces:
 *   - ens1f0
 *   - ens1f1
 * pollingInterval: 1000   # milliseconds, optional
 * logLevel: info          # optional
 * @endcode
 */

#include <string>
#include <vector>

namespace pfrelay {

namespace config {

/* ----------------------------- Constants ----------------------------- */

/// Location read when no --config flag is given.
inline constexpr const char* DEFAULT_CONFIG_PATH = "/etc/pf-status-relay/config.yaml";

/// Default monitoring tick period.
inline constexpr int DEFAULT_POLLING_INTERVAL_MS = 1000;

/// Default log level name.
inline constexpr const char* DEFAULT_LOG_LEVEL = "info";

/* ----------------------------- Config ----------------------------- */

struct Config {
  std::vector<std::string> interfaces;               ///< PF names to monitor (non-empty)
  int pollingIntervalMs{DEFAULT_POLLING_INTERVAL_MS}; ///< > 0
  std::string logLevel{DEFAULT_LOG_LEVEL};           ///< trace|debug|info|warn|error

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse and validate a configuration document.
 * @param text YAML text.
 * @param out Populated on success.
 * @param error Set to the cause on failure.
 * @return true if the document is valid.
 */
[[nodiscard]] bool parseConfig(const std::string& text, Config& out, std::string& error);

/**
 * @brief Read, parse and validate a configuration file.
 * @param path File path.
 * @param out Populated on success.
 * @param error Set to the cause on failure (unreadable file or invalid document).
 * @return true if the file is valid.
 */
[[nodiscard]] bool loadConfigFile(const std::string& path, Config& out, std::string& error);

} // namespace config

} // namespace pfrelay

#endif // PFRELAY_CONFIG_CONFIG_HPP
