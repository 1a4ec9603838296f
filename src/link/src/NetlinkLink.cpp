/**
 * @file NetlinkLink.cpp
 * @brief rtnetlink link reads and VF link-state writes.
 */

#include "src/link/inc/NetlinkLink.hpp"
#include "src/link/inc/NetlinkHandles.hpp"

#include <linux/if_link.h>   // IFLA_EXT_MASK
#include <linux/rtnetlink.h> // RTEXT_FILTER_VF

#include <netlink/attr.h>
#include <netlink/route/link/sriov.h>

#include <algorithm>
#include <cstring>
#include <utility>

#include <fmt/core.h>

namespace pfrelay {

namespace link {

namespace {

/* ----------------------------- Reply Parsing ----------------------------- */

/// nl_msg_parse callback: keep the first rtnl_link object of the reply.
void captureLink(nl_object* obj, void* arg) {
  auto* out = static_cast<LinkPtr*>(arg);
  if (*out) {
    return;
  }
  nl_object_get(obj);
  out->reset(reinterpret_cast<rtnl_link*>(obj));
}

int onLinkReply(nl_msg* msg, void* arg) {
  if (nl_msg_parse(msg, &captureLink, arg) < 0) {
    return NL_SKIP;
  }
  return NL_OK;
}

/**
 * Issue RTM_GETLINK for one interface, by index (name == nullptr) or by name.
 * rtnl_link_get_kernel() does not ask for VF info, so the request is built here
 * with RTEXT_FILTER_VF.
 */
LinkPtr fetchLink(int index, const char* name, std::string& error) {
  SocketPtr sock = openRouteSocket(error);
  if (!sock) {
    return nullptr;
  }

  // Single reply, no ACK to drain afterwards
  nl_socket_disable_auto_ack(sock.get());

  nl_msg* rawMsg = nullptr;
  int rc = rtnl_link_build_get_request(index, name, &rawMsg);
  if (rc < 0) {
    error = fmt::format("failed to build link request: {}", nl_geterror(rc));
    return nullptr;
  }
  MsgPtr msg(rawMsg);

  rc = nla_put_u32(msg.get(), IFLA_EXT_MASK, RTEXT_FILTER_VF);
  if (rc < 0) {
    error = fmt::format("failed to build link request: {}", nl_geterror(rc));
    return nullptr;
  }

  LinkPtr link;
  rc = nl_socket_modify_cb(sock.get(), NL_CB_VALID, NL_CB_CUSTOM, &onLinkReply, &link);
  if (rc < 0) {
    error = fmt::format("failed to install netlink callback: {}", nl_geterror(rc));
    return nullptr;
  }

  rc = nl_send_auto(sock.get(), msg.get());
  if (rc < 0) {
    error = fmt::format("failed to send link request: {}", nl_geterror(rc));
    return nullptr;
  }

  rc = nl_recvmsgs_default(sock.get());
  if (rc < 0) {
    error = nl_geterror(rc);
    return nullptr;
  }

  if (!link) {
    error = "link not found";
  }
  return link;
}

/* ----------------------------- Attribute Extraction ----------------------------- */

std::vector<VfInfo> readVfs(rtnl_link* link) {
  std::vector<VfInfo> vfs;

  std::uint32_t count = 0;
  if (rtnl_link_get_num_vf(link, &count) < 0 || count == 0) {
    return vfs;
  }

  vfs.reserve(count);
  for (std::uint32_t i = 0; i < count; ++i) {
    rtnl_link_vf* vf = rtnl_link_vf_get(link, i);
    if (vf == nullptr) {
      continue;
    }

    VfInfo info{};
    info.id = i;
    std::uint32_t id = 0;
    if (rtnl_link_vf_get_index(vf, &id) == 0) {
      info.id = id;
    }

    std::uint32_t state = 0;
    if (rtnl_link_vf_get_linkstate(vf, &state) == 0) {
      info.linkState = vfLinkStateFromRaw(state);
    }

    rtnl_link_vf_put(vf);
    vfs.push_back(info);
  }

  std::sort(vfs.begin(), vfs.end(),
            [](const VfInfo& a, const VfInfo& b) { return a.id < b.id; });
  return vfs;
}

SlaveInfo readSlave(rtnl_link* link, const std::string& netSysPath, const std::string& name) {
  const char* KIND = rtnl_link_get_slave_type(link);
  if (KIND == nullptr) {
    return NoSlave{};
  }
  if (std::strcmp(KIND, "bond") != 0) {
    return OtherSlave{KIND};
  }
  BondSlave bond{};
  std::string error;
  if (!readBondSlave(netSysPath.c_str(), name.c_str(), bond, error)) {
    return MalformedSlave{error};
  }
  return bond;
}

} // namespace

/* ----------------------------- NetlinkLinkSource ----------------------------- */

NetlinkLinkSource::NetlinkLinkSource(std::string netSysPath) : netSysPath_(std::move(netSysPath)) {}

bool NetlinkLinkSource::resolveByName(const std::string& name, LinkAttributes& out,
                                      std::string& error) {
  if (name.empty()) {
    error = "empty interface name";
    return false;
  }
  return resolve(0, name.c_str(), out, error);
}

bool NetlinkLinkSource::resolveByIndex(int index, LinkAttributes& out, std::string& error) {
  if (index <= 0) {
    error = fmt::format("invalid interface index {}", index);
    return false;
  }
  return resolve(index, nullptr, out, error);
}

bool NetlinkLinkSource::resolve(int index, const char* name, LinkAttributes& out,
                                std::string& error) {
  LinkPtr link = fetchLink(index, name, error);
  if (!link) {
    return false;
  }

  const char* NAME = rtnl_link_get_name(link.get());
  out.name = (NAME != nullptr) ? NAME : "";
  out.index = rtnl_link_get_ifindex(link.get());
  out.operState = operStateFromRaw(rtnl_link_get_operstate(link.get()));
  out.masterIndex = rtnl_link_get_master(link.get());
  out.slave = readSlave(link.get(), netSysPath_, out.name);
  out.vfs = readVfs(link.get());
  return true;
}

bool NetlinkLinkSource::resolveMaster(int masterIndex, BondInfo& out, std::string& error) {
  if (masterIndex <= 0) {
    error = fmt::format("invalid master index {}", masterIndex);
    return false;
  }

  LinkPtr link = fetchLink(masterIndex, nullptr, error);
  if (!link) {
    return false;
  }

  const char* NAME = rtnl_link_get_name(link.get());
  out.name = (NAME != nullptr) ? NAME : "";

  const char* TYPE = rtnl_link_get_type(link.get());
  if (TYPE == nullptr || std::strcmp(TYPE, "bond") != 0) {
    out.mode = BondMode::NOT_A_BOND;
    return true;
  }

  out.mode = readBondMode(netSysPath_.c_str(), out.name.c_str());
  return true;
}

/* ----------------------------- NetlinkVfControl ----------------------------- */

bool NetlinkVfControl::setVfLinkState(int pfIndex, std::uint32_t vfId, VfLinkState state,
                                      std::string& error) {
  if (state == VfLinkState::UNKNOWN) {
    error = "cannot apply unknown vf link state";
    return false;
  }

  SocketPtr sock = openRouteSocket(error);
  if (!sock) {
    return false;
  }

  LinkPtr orig(rtnl_link_alloc());
  LinkPtr change(rtnl_link_alloc());
  if (!orig || !change) {
    error = "failed to allocate link object";
    return false;
  }
  rtnl_link_set_ifindex(orig.get(), pfIndex);

  rtnl_link_vf* vf = rtnl_link_vf_alloc();
  if (vf == nullptr) {
    error = "failed to allocate vf object";
    return false;
  }
  rtnl_link_vf_set_index(vf, vfId);
  rtnl_link_vf_set_linkstate(vf, static_cast<std::uint32_t>(state));

  // The link takes its own reference
  int rc = rtnl_link_vf_add(change.get(), vf);
  rtnl_link_vf_put(vf);
  if (rc < 0) {
    error = fmt::format("failed to attach vf to request: {}", nl_geterror(rc));
    return false;
  }

  rc = rtnl_link_change(sock.get(), orig.get(), change.get(), 0);
  if (rc < 0) {
    error = nl_geterror(rc);
    return false;
  }

  return true;
}

} // namespace link

} // namespace pfrelay
