#ifndef PFRELAY_LINK_LACP_PORT_STATE_HPP
#define PFRELAY_LINK_LACP_PORT_STATE_HPP
/**
 * @file LacpPortState.hpp
 * @brief 802.1AX port-state bit decoding for bonding slaves.
 * @note The bonding driver exposes these as ad_actor_oper_port_state and
 *       ad_partner_oper_port_state (decimal) under /sys/class/net/<if>/bonding_slave/.
 */

#include "src/link/inc/LinkTypes.hpp"

#include <cstdint>
#include <string>

namespace pfrelay {

namespace link {

/* ----------------------------- Constants ----------------------------- */

/// Port-state bits, LSB first.
inline constexpr std::uint8_t LACP_STATE_ACTIVITY = 0x01;
inline constexpr std::uint8_t LACP_STATE_SHORT_TIMEOUT = 0x02;
inline constexpr std::uint8_t LACP_STATE_AGGREGATION = 0x04;
inline constexpr std::uint8_t LACP_STATE_SYNCHRONIZATION = 0x08;
inline constexpr std::uint8_t LACP_STATE_COLLECTING = 0x10;
inline constexpr std::uint8_t LACP_STATE_DISTRIBUTING = 0x20;
inline constexpr std::uint8_t LACP_STATE_DEFAULTED = 0x40;
inline constexpr std::uint8_t LACP_STATE_EXPIRED = 0x80;

/// Bits that must all be set on both ends for traffic to flow.
inline constexpr std::uint8_t LACP_STATE_IN_SERVICE =
    LACP_STATE_SYNCHRONIZATION | LACP_STATE_COLLECTING | LACP_STATE_DISTRIBUTING;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Check whether the LACP partnership is synchronized.
 * @param slave Bond slave record.
 * @return true if actor and partner are both in sync, collecting and
 *         distributing, and the actor is not running on defaulted or expired
 *         partner information.
 *
 * A defaulted actor carries the administrative partner defaults, which set the
 * sync bits without any LACPDU having been received; that is not a partnership.
 */
[[nodiscard]] bool isProtocolUp(const BondSlave& slave) noexcept;

/**
 * @brief Check whether the partner requested the fast (1 s) LACPDU rate.
 */
[[nodiscard]] bool isFastRate(const BondSlave& slave) noexcept;

/**
 * @brief Format port-state bits as a flag list (e.g. "ACT|AGG|SYNC|COL|DIST").
 */
[[nodiscard]] std::string formatPortState(std::uint8_t state);

} // namespace link

} // namespace pfrelay

#endif // PFRELAY_LINK_LACP_PORT_STATE_HPP
