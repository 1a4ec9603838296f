#ifndef PFRELAY_LINK_NETLINK_EVENTS_HPP
#define PFRELAY_LINK_NETLINK_EVENTS_HPP
/**
 * @file NetlinkEvents.hpp
 * @brief RTNLGRP_LINK subscription feeding the notification queue.
 * @note Linux-only. Uses libnl-3.
 *
 * A receive thread polls the multicast socket with a bounded timeout, so
 * cancellation is observed within EVENT_POLL_TIMEOUT_MS. RTM_NEWLINK and
 * RTM_DELLINK for tracked indices are queued; everything else is dropped here.
 * When the kernel reports a receive-buffer overrun, every tracked index is
 * queued once so the dispatcher re-reads state it may have missed.
 */

#include "src/link/inc/LinkSource.hpp"

#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/logger.h>

namespace pfrelay {

namespace link {

/* ----------------------------- Constants ----------------------------- */

/// Upper bound on how long the receive loop goes without checking for cancellation.
inline constexpr std::chrono::milliseconds EVENT_POLL_TIMEOUT_MS{250};

/* ----------------------------- NetlinkEventSource ----------------------------- */

class NetlinkEventSource final : public LinkEventSource {
public:
  explicit NetlinkEventSource(std::shared_ptr<spdlog::logger> log);
  ~NetlinkEventSource() override;

  NetlinkEventSource(const NetlinkEventSource&) = delete;
  NetlinkEventSource& operator=(const NetlinkEventSource&) = delete;

  [[nodiscard]] bool start(const std::vector<int>& indexes, NotificationQueue& queue,
                           const runtime::CancelScope& scope, std::string& error) override;

  void wait() override;

  /**
   * @brief Set the indices to forward and the queue they go to.
   * @note Called by start(); must not be called while the receive thread runs.
   */
  void track(const std::vector<int>& indexes, NotificationQueue& queue);

  /**
   * @brief Handle one link notification (called from the receive thread).
   * @param index Interface index carried by the message.
   *
   * Exposed for the libnl callback trampoline.
   */
  void onLinkMessage(int index);

  /// @brief Queue every tracked index once, after the kernel dropped notifications.
  void requeueAll();

private:
  struct Subscription;

  void receiveLoop(runtime::CancelScope scope);

  std::shared_ptr<spdlog::logger> log_;
  std::set<int> tracked_;
  NotificationQueue* queue_{nullptr};
  std::unique_ptr<Subscription> subscription_;
  std::thread worker_;
};

} // namespace link

} // namespace pfrelay

#endif // PFRELAY_LINK_NETLINK_EVENTS_HPP
