#ifndef PFRELAY_LINK_LINK_SOURCE_HPP
#define PFRELAY_LINK_LINK_SOURCE_HPP
/**
 * @file LinkSource.hpp
 * @brief OS collaborators consumed by the LACP engine.
 *
 * Three narrow interfaces: reading link attributes, writing VF link state and
 * delivering link-change notifications. Production implementations live in
 * NetlinkLink.hpp and NetlinkEvents.hpp; tests supply in-memory fakes.
 *
 * Implementations must be safe to call from several threads at once: every
 * monitored PF polls from its own thread.
 */

#include "src/link/inc/LinkTypes.hpp"
#include "src/runtime/inc/BoundedQueue.hpp"
#include "src/runtime/inc/CancelScope.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pfrelay {

namespace link {

/* ----------------------------- Constants ----------------------------- */

/// Pending link-change notifications held between the event source and the dispatcher.
inline constexpr std::size_t NOTIFICATION_QUEUE_CAPACITY = 100;

/// Queue of interface indices whose attributes may have changed.
using NotificationQueue = runtime::BoundedQueue<int>;

/* ----------------------------- LinkAttributeSource ----------------------------- */

class LinkAttributeSource {
public:
  virtual ~LinkAttributeSource() = default;

  /**
   * @brief Look up an interface by name.
   * @param name Interface name.
   * @param out Filled on success.
   * @param error Set to the cause on failure.
   * @return true if the interface exists and was read.
   */
  [[nodiscard]] virtual bool resolveByName(const std::string& name, LinkAttributes& out,
                                           std::string& error) = 0;

  /// @brief Look up an interface by index. Same contract as resolveByName.
  [[nodiscard]] virtual bool resolveByIndex(int index, LinkAttributes& out,
                                            std::string& error) = 0;

  /**
   * @brief Resolve a master index to its bonding device.
   * @return false if the index cannot be resolved. A master that resolves but
   *         is not a bond succeeds with mode NOT_A_BOND.
   */
  [[nodiscard]] virtual bool resolveMaster(int masterIndex, BondInfo& out,
                                           std::string& error) = 0;
};

/* ----------------------------- VfControl ----------------------------- */

class VfControl {
public:
  virtual ~VfControl() = default;

  /**
   * @brief Apply a link-state policy to one VF of a PF.
   * @return false with error set if the kernel rejected the change.
   */
  [[nodiscard]] virtual bool setVfLinkState(int pfIndex, std::uint32_t vfId, VfLinkState state,
                                            std::string& error) = 0;
};

/* ----------------------------- LinkEventSource ----------------------------- */

class LinkEventSource {
public:
  virtual ~LinkEventSource() = default;

  /**
   * @brief Start delivering change notifications for the given indices.
   * @param indexes Interface indices of interest; others are filtered out.
   * @param queue Destination; full-queue drops are the source's to report.
   * @param scope Delivery stops when this scope is cancelled.
   * @param error Set to the cause if the subscription could not be set up.
   * @return true if the producer is running.
   */
  [[nodiscard]] virtual bool start(const std::vector<int>& indexes, NotificationQueue& queue,
                                   const runtime::CancelScope& scope, std::string& error) = 0;

  /// @brief Block until the producer has exited. No-op if never started.
  virtual void wait() = 0;
};

} // namespace link

} // namespace pfrelay

#endif // PFRELAY_LINK_LINK_SOURCE_HPP
