#ifndef PFRELAY_LACP_INTERFACES_HPP
#define PFRELAY_LACP_INTERFACES_HPP
/**
 * @file Interfaces.hpp
 * @brief Registry of configured PFs and the link-change dispatcher.
 * @note Thread-safety: construct, start, and wait from one thread. After
 *       start() the dispatcher thread owns every PhysicalFunction until wait()
 *       returns; find() is only safe before start() or after wait().
 *
 * Lifecycle:
 *   1. Construct with the configured names (unresolvable names are skipped).
 *   2. start(): inspect every PF, monitor the eligible ones, spawn the dispatcher.
 *   3. The dispatcher re-reads a PF on each notification for its index and
 *      starts or stops monitoring according to the new eligibility.
 *   4. Cancelling the root scope makes the dispatcher stop every monitor and exit.
 *      The dispatcher and the monitors observe a child of the root taken in
 *      start(), so destroying the registry cancels only its own tasks.
 *   5. wait() joins the dispatcher.
 */

#include "src/lacp/inc/PhysicalFunction.hpp"
#include "src/link/inc/LinkSource.hpp"
#include "src/runtime/inc/CancelScope.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/logger.h>

namespace pfrelay {

namespace lacp {

/* ----------------------------- Interfaces ----------------------------- */

class Interfaces {
public:
  /**
   * @param names Configured PF names.
   * @param pollingInterval Monitoring tick period given to every PF.
   * @param links Attribute source (must outlive the registry).
   * @param vfControl VF link-state sink (must outlive the registry).
   * @param log Logger.
   */
  Interfaces(const std::vector<std::string>& names, std::chrono::milliseconds pollingInterval,
             link::LinkAttributeSource& links, link::VfControl& vfControl,
             std::shared_ptr<spdlog::logger> log);

  /// Cancels the registry's scope, which stops every monitor, and joins the dispatcher.
  ~Interfaces();

  Interfaces(const Interfaces&) = delete;
  Interfaces& operator=(const Interfaces&) = delete;

  [[nodiscard]] bool empty() const noexcept { return pfs_.empty(); }
  [[nodiscard]] std::size_t size() const noexcept { return pfs_.size(); }

  /// @brief Interface indices of the registered PFs, ascending.
  [[nodiscard]] std::vector<int> indexes() const;

  /// @brief Registered PF for an index, or nullptr.
  [[nodiscard]] PhysicalFunction* find(int index) const noexcept;

  /**
   * @brief Begin monitoring eligible PFs and start the dispatcher.
   * @param root Scope whose cancellation shuts the registry down.
   * @param queue Link-change notifications to consume (must outlive wait()).
   */
  void start(const runtime::CancelScope& root, link::NotificationQueue& queue);

  /**
   * @brief Handle one link-change notification.
   * @param index Interface index from the notification.
   *
   * Called by the dispatcher; exposed so the reaction to a single event can be
   * driven without a queue.
   */
  void processEvent(int index);

  /// @brief Stop monitoring on every PF, sequentially.
  void stopAll();

  /// @brief Block until the dispatcher has returned. No-op if never started.
  void wait();

private:
  void dispatch(runtime::CancelScope root, link::NotificationQueue& queue);

  std::map<int, std::unique_ptr<PhysicalFunction>> pfs_;
  std::shared_ptr<spdlog::logger> log_;
  runtime::CancelScope root_; ///< Parent of every monitoring scope; child of the root after start()
  std::thread dispatcher_;
};

} // namespace lacp

} // namespace pfrelay

#endif // PFRELAY_LACP_INTERFACES_HPP
