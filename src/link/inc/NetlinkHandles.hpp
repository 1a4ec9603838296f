#ifndef PFRELAY_LINK_NETLINK_HANDLES_HPP
#define PFRELAY_LINK_NETLINK_HANDLES_HPP
/**
 * @file NetlinkHandles.hpp
 * @brief Owning handles for libnl objects.
 */

#include <netlink/msg.h>
#include <netlink/netlink.h>
#include <netlink/route/link.h>
#include <netlink/socket.h>

#include <memory>
#include <string>

#include <fmt/core.h>

namespace pfrelay {

namespace link {

struct SocketDeleter {
  void operator()(nl_sock* sock) const noexcept { nl_socket_free(sock); }
};

struct LinkDeleter {
  void operator()(rtnl_link* link) const noexcept { rtnl_link_put(link); }
};

struct MsgDeleter {
  void operator()(nl_msg* msg) const noexcept { nlmsg_free(msg); }
};

using SocketPtr = std::unique_ptr<nl_sock, SocketDeleter>;
using LinkPtr = std::unique_ptr<rtnl_link, LinkDeleter>;
using MsgPtr = std::unique_ptr<nl_msg, MsgDeleter>;

/**
 * @brief Allocate and connect a NETLINK_ROUTE socket.
 * @param error Set to the cause on failure.
 * @return Connected socket, or nullptr.
 */
[[nodiscard]] inline SocketPtr openRouteSocket(std::string& error) {
  SocketPtr sock(nl_socket_alloc());
  if (!sock) {
    error = "failed to allocate netlink socket";
    return nullptr;
  }

  const int RC = nl_connect(sock.get(), NETLINK_ROUTE);
  if (RC < 0) {
    error = fmt::format("failed to connect netlink socket: {}", nl_geterror(RC));
    return nullptr;
  }

  return sock;
}

} // namespace link

} // namespace pfrelay

#endif // PFRELAY_LINK_NETLINK_HANDLES_HPP
