#ifndef PFRELAY_LINK_LINK_TYPES_HPP
#define PFRELAY_LINK_LINK_TYPES_HPP
/**
 * @file LinkTypes.hpp
 * @brief Link attribute snapshots exchanged with the OS collaborators.
 *
 * Enumerator values match the kernel UAPI (IF_OPER_*, IFLA_VF_LINK_STATE_*,
 * BOND_MODE_*) so conversions from netlink and sysfs are plain casts after a
 * range check.
 */

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace pfrelay {

namespace link {

/* ----------------------------- OperState ----------------------------- */

/**
 * @brief RFC 2863 operational state (IF_OPER_*).
 */
enum class OperState : std::uint8_t {
  UNKNOWN = 0,
  NOT_PRESENT = 1,
  DOWN = 2,
  LOWER_LAYER_DOWN = 3,
  TESTING = 4,
  DORMANT = 5,
  UP = 6,
};

/// @brief Kernel-style name ("up", "lowerlayerdown", ...).
[[nodiscard]] const char* toString(OperState state) noexcept;

/// @brief Convert a raw IF_OPER_* value; out-of-range values map to UNKNOWN.
[[nodiscard]] OperState operStateFromRaw(std::uint32_t raw) noexcept;

/* ----------------------------- VfLinkState ----------------------------- */

/**
 * @brief VF administrative link-state policy (IFLA_VF_LINK_STATE_*).
 */
enum class VfLinkState : std::uint8_t {
  AUTO = 0,
  ENABLE = 1,
  DISABLE = 2,
  UNKNOWN = 0xFF, ///< Attribute missing or value not recognized
};

[[nodiscard]] const char* toString(VfLinkState state) noexcept;

[[nodiscard]] VfLinkState vfLinkStateFromRaw(std::uint32_t raw) noexcept;

/* ----------------------------- BondMode ----------------------------- */

/**
 * @brief Bonding driver mode (BOND_MODE_*).
 */
enum class BondMode : std::uint8_t {
  BALANCE_RR = 0,
  ACTIVE_BACKUP = 1,
  BALANCE_XOR = 2,
  BROADCAST = 3,
  IEEE_802_3AD = 4,
  BALANCE_TLB = 5,
  BALANCE_ALB = 6,
  NOT_A_BOND = 0xFE, ///< Master exists but is not a bonding device
  UNKNOWN = 0xFF,
};

[[nodiscard]] const char* toString(BondMode mode) noexcept;

[[nodiscard]] BondMode bondModeFromRaw(std::int32_t raw) noexcept;

/* ----------------------------- Slave Record ----------------------------- */

/// Interface is not enslaved to any master.
struct NoSlave {};

/**
 * @brief Interface is a bonding slave; LACP port states as seen by the bond.
 */
struct BondSlave {
  std::uint8_t actorOperPortState{0};   ///< 802.1AX actor oper port state bits
  std::uint8_t partnerOperPortState{0}; ///< 802.1AX partner oper port state bits
};

/**
 * @brief Interface is enslaved to something other than a bond (bridge, team, vrf...).
 */
struct OtherSlave {
  std::string kind; ///< IFLA_INFO_SLAVE_KIND
};

/**
 * @brief Interface is a bonding slave but its port states could not be read.
 */
struct MalformedSlave {
  std::string reason;
};

/// Tagged slave record.
using SlaveInfo = std::variant<NoSlave, BondSlave, OtherSlave, MalformedSlave>;

/* ----------------------------- Snapshots ----------------------------- */

/**
 * @brief One VF entry on a PF.
 */
struct VfInfo {
  std::uint32_t id{0};
  VfLinkState linkState{VfLinkState::UNKNOWN};
};

/**
 * @brief Attributes of a network interface at the time of the lookup.
 */
struct LinkAttributes {
  std::string name;
  int index{0};
  OperState operState{OperState::UNKNOWN};
  int masterIndex{0}; ///< 0 when the interface has no master
  SlaveInfo slave{NoSlave{}};
  std::vector<VfInfo> vfs;

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Master device as resolved from a PF's master index.
 */
struct BondInfo {
  std::string name;
  BondMode mode{BondMode::UNKNOWN};
};

} // namespace link

} // namespace pfrelay

#endif // PFRELAY_LINK_LINK_TYPES_HPP
