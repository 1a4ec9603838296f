/**
 * @file NetlinkEvents.cpp
 * @brief RTNLGRP_LINK receive loop.
 */

#include "src/link/inc/NetlinkEvents.hpp"
#include "src/link/inc/NetlinkHandles.hpp"

#include <linux/rtnetlink.h> // RTNLGRP_LINK, RTM_NEWLINK, ifinfomsg
#include <poll.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include <fmt/core.h>

namespace pfrelay {

namespace link {

struct NetlinkEventSource::Subscription {
  SocketPtr sock;
};

namespace {

/// libnl NL_CB_VALID trampoline into the owning event source.
int onEvent(nl_msg* msg, void* arg) {
  nlmsghdr* hdr = nlmsg_hdr(msg);
  if (hdr->nlmsg_type != RTM_NEWLINK && hdr->nlmsg_type != RTM_DELLINK) {
    return NL_SKIP;
  }
  if (nlmsg_valid_hdr(hdr, sizeof(ifinfomsg)) == 0) {
    return NL_SKIP;
  }

  const auto* IFI = static_cast<const ifinfomsg*>(nlmsg_data(hdr));
  static_cast<NetlinkEventSource*>(arg)->onLinkMessage(IFI->ifi_index);
  return NL_OK;
}

} // namespace

NetlinkEventSource::NetlinkEventSource(std::shared_ptr<spdlog::logger> log)
    : log_(std::move(log)) {}

NetlinkEventSource::~NetlinkEventSource() { wait(); }

bool NetlinkEventSource::start(const std::vector<int>& indexes, NotificationQueue& queue,
                               const runtime::CancelScope& scope, std::string& error) {
  if (worker_.joinable()) {
    error = "link subscription already started";
    return false;
  }

  auto subscription = std::make_unique<Subscription>();
  subscription->sock = openRouteSocket(error);
  if (!subscription->sock) {
    return false;
  }
  nl_sock* sock = subscription->sock.get();

  // Multicast notifications carry no sequence numbers
  nl_socket_disable_seq_check(sock);

  int rc = nl_socket_modify_cb(sock, NL_CB_VALID, NL_CB_CUSTOM, &onEvent, this);
  if (rc < 0) {
    error = fmt::format("failed to install netlink callback: {}", nl_geterror(rc));
    return false;
  }

  rc = nl_socket_add_membership(sock, RTNLGRP_LINK);
  if (rc < 0) {
    error = fmt::format("failed to join RTNLGRP_LINK: {}", nl_geterror(rc));
    return false;
  }

  rc = nl_socket_set_nonblocking(sock);
  if (rc < 0) {
    error = fmt::format("failed to set netlink socket non-blocking: {}", nl_geterror(rc));
    return false;
  }

  track(indexes, queue);
  subscription_ = std::move(subscription);

  log_->debug("subscribed to link changes interfaces={}", tracked_.size());
  worker_ = std::thread(&NetlinkEventSource::receiveLoop, this, scope);
  return true;
}

void NetlinkEventSource::wait() {
  if (worker_.joinable()) {
    worker_.join();
  }
}

void NetlinkEventSource::track(const std::vector<int>& indexes, NotificationQueue& queue) {
  tracked_ = std::set<int>(indexes.begin(), indexes.end());
  queue_ = &queue;
}

void NetlinkEventSource::onLinkMessage(int index) {
  if (queue_ == nullptr || tracked_.count(index) == 0) {
    return;
  }

  log_->debug("link event index={}", index);
  if (!queue_->tryPush(index)) {
    log_->warn("notification queue full, dropping link event index={}", index);
  }
}

void NetlinkEventSource::requeueAll() {
  for (const int INDEX : tracked_) {
    onLinkMessage(INDEX);
  }
}

void NetlinkEventSource::receiveLoop(runtime::CancelScope scope) {
  nl_sock* sock = subscription_->sock.get();

  pollfd pfd{};
  pfd.fd = nl_socket_get_fd(sock);
  pfd.events = POLLIN;

  while (!scope.isCancelled()) {
    pfd.revents = 0;
    const int READY = ::poll(&pfd, 1, static_cast<int>(EVENT_POLL_TIMEOUT_MS.count()));
    if (READY < 0) {
      if (errno != EINTR) {
        log_->error("failed to poll netlink socket error={}", std::strerror(errno));
        scope.waitFor(EVENT_POLL_TIMEOUT_MS);
      }
      continue;
    }
    if (READY == 0) {
      continue;
    }

    const int RC = nl_recvmsgs_default(sock);
    if (RC >= 0 || RC == -NLE_AGAIN) {
      continue;
    }

    if (RC == -NLE_NOMEM) {
      // ENOBUFS: the kernel discarded notifications for this socket
      log_->warn("netlink receive buffer overrun, rescanning interfaces");
      requeueAll();
    } else {
      log_->error("failed to receive link events error={}", nl_geterror(RC));
    }
  }

  log_->debug("ctx cancelled routine=subscribe");
}

} // namespace link

} // namespace pfrelay
