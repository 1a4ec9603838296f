#ifndef PFRELAY_LINK_BONDING_SYSFS_HPP
#define PFRELAY_LINK_BONDING_SYSFS_HPP
/**
 * @file BondingSysfs.hpp
 * @brief Bonding attributes the rtnetlink library does not decode.
 * @note Linux-only. Reads /sys/class/net/<bond>/bonding/ and
 *       /sys/class/net/<slave>/bonding_slave/.
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 *
 * The root directory is a parameter so tests can point it at a fixture tree.
 */

#include "src/link/inc/LinkTypes.hpp"

#include <string>

namespace pfrelay {

namespace link {

/* ----------------------------- Constants ----------------------------- */

/// Default sysfs network class directory.
inline constexpr const char* NET_SYS_PATH = "/sys/class/net";

/* ----------------------------- API ----------------------------- */

/**
 * @brief Read a bond's mode.
 * @param netSysPath Network class directory (normally NET_SYS_PATH).
 * @param bondName Bond interface name.
 * @return Mode parsed from bonding/mode ("802.3ad 4"), UNKNOWN if unreadable.
 *
 * Sources:
 *  - /sys/class/net/\<bond\>/bonding/mode
 */
[[nodiscard]] BondMode readBondMode(const char* netSysPath, const char* bondName) noexcept;

/**
 * @brief Read a bonding slave's LACP port states.
 * @param netSysPath Network class directory (normally NET_SYS_PATH).
 * @param slaveName Slave interface name.
 * @param out Port states on success; untouched on failure.
 * @param error Cause on failure.
 * @return true if both port states were read and fit in a byte.
 *
 * Sources:
 *  - /sys/class/net/\<if\>/bonding_slave/ad_actor_oper_port_state
 *  - /sys/class/net/\<if\>/bonding_slave/ad_partner_oper_port_state
 */
[[nodiscard]] bool readBondSlave(const char* netSysPath, const char* slaveName, BondSlave& out,
                                 std::string& error);

} // namespace link

} // namespace pfrelay

#endif // PFRELAY_LINK_BONDING_SYSFS_HPP
