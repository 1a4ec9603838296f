/**
 * @file BondingSysfs.cpp
 * @brief Bonding sysfs readers.
 */

#include "src/link/inc/BondingSysfs.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <cstdint>
#include <cstdio>
#include <string>

#include <fmt/core.h>

namespace pfrelay {

namespace link {

using pfrelay::helpers::files::parseInt;
using pfrelay::helpers::files::readFileToBuffer;
using pfrelay::helpers::strings::lastToken;

namespace {

constexpr std::size_t PATH_BUFFER_SIZE = 256;
constexpr std::size_t READ_BUFFER_SIZE = 64;

/// Read one port-state file; the kernel prints the state byte in decimal.
bool readPortState(const char* path, std::uint8_t& out, std::string& error) {
  char readBuf[READ_BUFFER_SIZE];
  if (readFileToBuffer(path, readBuf, sizeof(readBuf)) == 0) {
    error = fmt::format("cannot read {}", path);
    return false;
  }

  std::int32_t raw = -1;
  if (!parseInt(readBuf, raw) || raw < 0 || raw > 0xFF) {
    error = fmt::format("invalid port state '{}' in {}", readBuf, path);
    return false;
  }

  out = static_cast<std::uint8_t>(raw);
  return true;
}

} // namespace

BondMode readBondMode(const char* netSysPath, const char* bondName) noexcept {
  if (netSysPath == nullptr || bondName == nullptr || bondName[0] == '\0') {
    return BondMode::UNKNOWN;
  }

  char pathBuf[PATH_BUFFER_SIZE];
  char readBuf[READ_BUFFER_SIZE];

  std::snprintf(pathBuf, sizeof(pathBuf), "%s/%s/bonding/mode", netSysPath, bondName);
  if (readFileToBuffer(pathBuf, readBuf, sizeof(readBuf)) == 0) {
    return BondMode::UNKNOWN;
  }

  // Format is "<name> <number>", e.g. "802.3ad 4"
  std::int32_t raw = -1;
  if (!parseInt(lastToken(readBuf), raw)) {
    return BondMode::UNKNOWN;
  }

  return bondModeFromRaw(raw);
}

bool readBondSlave(const char* netSysPath, const char* slaveName, BondSlave& out,
                   std::string& error) {
  if (netSysPath == nullptr || slaveName == nullptr || slaveName[0] == '\0') {
    error = "empty slave name";
    return false;
  }

  char pathBuf[PATH_BUFFER_SIZE];
  BondSlave slave{};

  std::snprintf(pathBuf, sizeof(pathBuf), "%s/%s/bonding_slave/ad_actor_oper_port_state",
                netSysPath, slaveName);
  if (!readPortState(pathBuf, slave.actorOperPortState, error)) {
    return false;
  }

  std::snprintf(pathBuf, sizeof(pathBuf), "%s/%s/bonding_slave/ad_partner_oper_port_state",
                netSysPath, slaveName);
  if (!readPortState(pathBuf, slave.partnerOperPortState, error)) {
    return false;
  }

  out = slave;
  return true;
}

} // namespace link

} // namespace pfrelay
