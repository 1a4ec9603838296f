#ifndef PFRELAY_LINK_NETLINK_LINK_HPP
#define PFRELAY_LINK_NETLINK_LINK_HPP
/**
 * @file NetlinkLink.hpp
 * @brief rtnetlink implementations of LinkAttributeSource and VfControl.
 * @note Linux-only. Uses libnl-3 / libnl-route-3; bonding details from sysfs.
 * @note Thread-safe: every call opens its own NETLINK_ROUTE socket, so monitors
 *       polling different PFs never contend on a shared handle.
 */

#include "src/link/inc/BondingSysfs.hpp"
#include "src/link/inc/LinkSource.hpp"

#include <cstdint>
#include <string>

namespace pfrelay {

namespace link {

/* ----------------------------- NetlinkLinkSource ----------------------------- */

/**
 * @brief Reads link attributes with RTM_GETLINK (VF info included).
 *
 * Sources:
 *  - RTM_GETLINK with IFLA_EXT_MASK = RTEXT_FILTER_VF
 *  - IFLA_OPERSTATE, IFLA_MASTER, IFLA_INFO_SLAVE_KIND, IFLA_VFINFO_LIST
 *  - \<netSysPath\>/\<if\>/bonding_slave/ad_*_oper_port_state
 *  - \<netSysPath\>/\<bond\>/bonding/mode
 */
class NetlinkLinkSource final : public LinkAttributeSource {
public:
  explicit NetlinkLinkSource(std::string netSysPath = NET_SYS_PATH);

  [[nodiscard]] bool resolveByName(const std::string& name, LinkAttributes& out,
                                   std::string& error) override;

  [[nodiscard]] bool resolveByIndex(int index, LinkAttributes& out, std::string& error) override;

  [[nodiscard]] bool resolveMaster(int masterIndex, BondInfo& out, std::string& error) override;

private:
  bool resolve(int index, const char* name, LinkAttributes& out, std::string& error);

  std::string netSysPath_;
};

/* ----------------------------- NetlinkVfControl ----------------------------- */

/**
 * @brief Sets VF link state with RTM_SETLINK carrying IFLA_VF_LINK_STATE.
 */
class NetlinkVfControl final : public VfControl {
public:
  [[nodiscard]] bool setVfLinkState(int pfIndex, std::uint32_t vfId, VfLinkState state,
                                    std::string& error) override;
};

} // namespace link

} // namespace pfrelay

#endif // PFRELAY_LINK_NETLINK_LINK_HPP
