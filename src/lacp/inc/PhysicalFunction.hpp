#ifndef PFRELAY_LACP_PHYSICAL_FUNCTION_HPP
#define PFRELAY_LACP_PHYSICAL_FUNCTION_HPP
/**
 * @file PhysicalFunction.hpp
 * @brief Physical function state and its LACP monitoring task.
 * @note Thread-safety: a PhysicalFunction is owned by the dispatcher thread;
 *       inspect/update/startMonitoring/stopMonitoring must not be called
 *       concurrently. The monitoring task it spawns touches only VF state.
 *
 * A PF is monitored only while it is up and enslaved to an 802.3ad bond. While
 * monitored, every polling tick re-reads the PF and drives its VFs:
 *
 *   LACP synchronized      -> VFs in "disable" are set to "auto"
 *   LACP not synchronized  -> VFs in "auto" are set to "disable"
 *
 * VFs in any other state (e.g. "enable") are never touched.
 */

#include "src/link/inc/LinkSource.hpp"
#include "src/link/inc/LinkTypes.hpp"
#include "src/runtime/inc/CancelScope.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/logger.h>

namespace pfrelay {

namespace lacp {

/* ----------------------------- InspectStatus ----------------------------- */

/**
 * @brief Eligibility outcome; each failure names the clause that failed.
 */
enum class InspectStatus : std::uint8_t {
  OK = 0,
  LINK_NOT_UP,       ///< Operational state is not up
  NO_MASTER,         ///< Master index is 0
  MASTER_UNRESOLVED, ///< Master index could not be looked up
  NOT_LACP_BOND,     ///< Master is not a bond in 802.3ad mode
};

[[nodiscard]] const char* toString(InspectStatus status) noexcept;

struct InspectResult {
  InspectStatus status{InspectStatus::OK};
  std::string message; ///< Cause for log lines; empty when OK

  [[nodiscard]] bool ok() const noexcept { return status == InspectStatus::OK; }
};

/* ----------------------------- UpdateStatus ----------------------------- */

enum class UpdateStatus : std::uint8_t {
  UNCHANGED = 0,
  CHANGED,
  LOOKUP_FAILED,
};

[[nodiscard]] const char* toString(UpdateStatus status) noexcept;

/* ----------------------------- TickOutcome ----------------------------- */

/**
 * @brief What a single monitoring pass did.
 */
enum class TickOutcome : std::uint8_t {
  RECONCILED = 0,  ///< LACP state evaluated and VFs reconciled
  READ_FAILED,     ///< PF could not be re-read
  NO_VFS,          ///< PF has no VFs
  NO_SLAVE,        ///< PF is not enslaved
  NOT_BOND_SLAVE,  ///< PF is enslaved to something other than a bond
  MALFORMED_SLAVE, ///< PF is a bond slave but its port states are unreadable
};

[[nodiscard]] const char* toString(TickOutcome outcome) noexcept;

/* ----------------------------- LacpMonitor ----------------------------- */

/**
 * @brief Per-PF reconciliation state carried across polling ticks.
 *
 * One instance lives inside each monitoring task. tick() is a single pass;
 * the task calls it once per polling interval.
 */
class LacpMonitor {
public:
  LacpMonitor(int pfIndex, std::string pfName, link::LinkAttributeSource& links,
              link::VfControl& vfControl, std::shared_ptr<spdlog::logger> log);

  /// @brief Run one reconciliation pass.
  TickOutcome tick();

  /// @brief Last LACP state this monitor acted on.
  [[nodiscard]] bool lacpUp() const noexcept { return lacpUp_; }

private:
  void bringUp(const std::vector<link::VfInfo>& vfs);
  void bringDown(const std::vector<link::VfInfo>& vfs);
  void setVf(std::uint32_t vfId, link::VfLinkState state);

  int pfIndex_;
  std::string pfName_;
  link::LinkAttributeSource& links_;
  link::VfControl& vfControl_;
  std::shared_ptr<spdlog::logger> log_;

  bool lacpUp_{false};
  bool logNoVfs_{true};     ///< Cleared after "no VFs" is logged, set again once VFs exist
  bool firstDownLog_{true}; ///< Report the initial down state even though lacpUp_ starts false
};

/* ----------------------------- PhysicalFunction ----------------------------- */

class PhysicalFunction {
public:
  /**
   * @param attrs Attributes read when the PF was resolved at startup.
   * @param pollingInterval Monitoring tick period (> 0).
   * @param links Attribute source shared with the registry.
   * @param vfControl VF link-state sink.
   * @param log Logger.
   */
  PhysicalFunction(const link::LinkAttributes& attrs, std::chrono::milliseconds pollingInterval,
                   link::LinkAttributeSource& links, link::VfControl& vfControl,
                   std::shared_ptr<spdlog::logger> log);

  /// Stops monitoring, joining the task if one is running.
  ~PhysicalFunction();

  PhysicalFunction(const PhysicalFunction&) = delete;
  PhysicalFunction& operator=(const PhysicalFunction&) = delete;

  /**
   * @brief Check whether this PF can be monitored.
   * @return OK only if the link is up, has a master, and the master is an
   *         802.3ad bond. Reads cached attributes plus a fresh master lookup.
   */
  [[nodiscard]] InspectResult inspect() const;

  /**
   * @brief Re-read attributes and record an operational-state change.
   * @param error Set when LOOKUP_FAILED.
   * @return UNCHANGED if the operational state is the same as cached (the cache
   *         is left as-is), CHANGED after overwriting the cache.
   */
  [[nodiscard]] UpdateStatus update(std::string& error);

  /**
   * @brief Spawn the monitoring task unless one is already running.
   * @param parent Scope whose cancellation also ends the task.
   */
  void startMonitoring(const runtime::CancelScope& parent);

  /**
   * @brief Cancel the monitoring task and wait for it to exit.
   * @note Returns immediately if not monitoring.
   */
  void stopMonitoring();

  [[nodiscard]] bool isMonitoring() const noexcept { return monitoring_; }
  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  [[nodiscard]] int index() const noexcept { return index_; }
  [[nodiscard]] link::OperState operState() const noexcept { return operState_; }
  [[nodiscard]] int masterIndex() const noexcept { return masterIndex_; }

private:
  void runMonitor(runtime::CancelScope scope, LacpMonitor monitor, std::string name) const;

  std::string name_;
  int index_;
  link::OperState operState_;
  int masterIndex_;

  const std::chrono::milliseconds pollingInterval_;
  link::LinkAttributeSource& links_;
  link::VfControl& vfControl_;
  std::shared_ptr<spdlog::logger> log_;

  bool monitoring_{false};
  std::optional<runtime::CancelScope> scope_;
  std::thread worker_;
};

} // namespace lacp

} // namespace pfrelay

#endif // PFRELAY_LACP_PHYSICAL_FUNCTION_HPP
