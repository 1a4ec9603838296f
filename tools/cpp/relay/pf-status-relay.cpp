/**
 * @file pf-status-relay.cpp
 * @brief Daemon relaying LACP state of bonded PFs to the link state of their VFs.
 *
 * While a monitored PF's LACP partnership is down its VFs in "auto" are forced
 * to "disable", so guests see carrier loss and fail over; once LACP is back
 * they are returned to "auto". Runs until SIGINT or SIGTERM.
 */

#include "src/config/inc/Config.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/lacp/inc/Interfaces.hpp"
#include "src/link/inc/LinkSource.hpp"
#include "src/link/inc/NetlinkEvents.hpp"
#include "src/link/inc/NetlinkLink.hpp"
#include "src/logging/inc/Logging.hpp"
#include "src/runtime/inc/CancelScope.hpp"

#include <pthread.h>

#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace args = pfrelay::helpers::args;

namespace {

/* ----------------------------- Argument Handling ----------------------------- */

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_CONFIG = 1,
  ARG_LOG_LEVEL = 2,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Relay LACP state of bonded physical functions to the link state of their VFs.\n\n"
    "Stops on SIGINT or SIGTERM.";

/// Build argument definitions.
args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_CONFIG] = {"--config", 1, false,
                     "Configuration file (default: /etc/pf-status-relay/config.yaml)"};
  map[ARG_LOG_LEVEL] = {"--log-level", 1, false,
                        "trace, debug, info, warn or error (overrides the file)"};
  return map;
}

/* ----------------------------- Signal Handling ----------------------------- */

/// Block the shutdown signals so every thread spawned afterwards inherits the mask.
int blockShutdownSignals(sigset_t& set) {
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  return pthread_sigmask(SIG_BLOCK, &set, nullptr);
}

/* ----------------------------- Daemon ----------------------------- */

int run(const pfrelay::config::Config& cfg, spdlog::level::level_enum level) {
  auto log = pfrelay::logging::makeStdoutLogger(level);
  log->info("starting pf-status-relay {}", cfg.toString());

  sigset_t signals;
  if (const int RC = blockShutdownSignals(signals); RC != 0) {
    log->error("failed to block shutdown signals error={}", std::strerror(RC));
    return 1;
  }

  pfrelay::link::NetlinkLinkSource links;
  pfrelay::link::NetlinkVfControl vfControl;

  pfrelay::lacp::Interfaces interfaces(cfg.interfaces,
                                       std::chrono::milliseconds(cfg.pollingIntervalMs), links,
                                       vfControl, log);
  if (interfaces.empty()) {
    log->error("no interfaces found in node");
    return 1;
  }

  pfrelay::runtime::CancelScope root;
  pfrelay::link::NotificationQueue queue(pfrelay::link::NOTIFICATION_QUEUE_CAPACITY);
  pfrelay::link::NetlinkEventSource events(log);

  interfaces.start(root, queue);

  std::string error;
  if (!events.start(interfaces.indexes(), queue, root, error)) {
    // Monitors keep polling; only reactions to up/down transitions are lost
    log->error("failed to subscribe to link changes error={}", error);
  }

  int signum = 0;
  if (sigwait(&signals, &signum) != 0) {
    log->error("failed to wait for shutdown signal");
  } else {
    log->info("received signal signal={}", strsignal(signum));
  }

  root.cancel();
  interfaces.wait();
  events.wait();

  log->info("pf-status-relay stopped dropped_events={}", queue.dropped());
  return 0;
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;

  std::vector<std::string_view> argList;
  argList.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    argList.emplace_back(argv[i]);
  }

  std::string error;
  if (!args::parseArgs(argList, ARG_MAP, pargs, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 1;
  }

  if (pargs.count(ARG_HELP) != 0) {
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 0;
  }

  std::string configPath = pfrelay::config::DEFAULT_CONFIG_PATH;
  if (pargs.count(ARG_CONFIG) != 0) {
    configPath = std::string(pargs[ARG_CONFIG][0]);
  }

  pfrelay::config::Config cfg{};
  if (!pfrelay::config::loadConfigFile(configPath, cfg, error)) {
    fmt::print(stderr, "Error: {}\n", error);
    return 1;
  }

  if (pargs.count(ARG_LOG_LEVEL) != 0) {
    cfg.logLevel = std::string(pargs[ARG_LOG_LEVEL][0]);
  }

  spdlog::level::level_enum level{};
  if (!pfrelay::logging::parseLevel(cfg.logLevel, level)) {
    fmt::print(stderr, "Error: invalid log level '{}'\n", cfg.logLevel);
    return 1;
  }

  return run(cfg, level);
}
