/**
 * @file PhysicalFunction.cpp
 * @brief PF eligibility, attribute refresh and the LACP monitoring task.
 */

#include "src/lacp/inc/PhysicalFunction.hpp"
#include "src/link/inc/LacpPortState.hpp"

#include <utility>
#include <variant>

#include <fmt/core.h>

namespace pfrelay {

namespace lacp {

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(InspectStatus status) noexcept {
  switch (status) {
  case InspectStatus::OK:
    return "OK";
  case InspectStatus::LINK_NOT_UP:
    return "LINK_NOT_UP";
  case InspectStatus::NO_MASTER:
    return "NO_MASTER";
  case InspectStatus::MASTER_UNRESOLVED:
    return "MASTER_UNRESOLVED";
  case InspectStatus::NOT_LACP_BOND:
    return "NOT_LACP_BOND";
  }
  return "UNKNOWN";
}

const char* toString(UpdateStatus status) noexcept {
  switch (status) {
  case UpdateStatus::UNCHANGED:
    return "UNCHANGED";
  case UpdateStatus::CHANGED:
    return "CHANGED";
  case UpdateStatus::LOOKUP_FAILED:
    return "LOOKUP_FAILED";
  }
  return "UNKNOWN";
}

const char* toString(TickOutcome outcome) noexcept {
  switch (outcome) {
  case TickOutcome::RECONCILED:
    return "RECONCILED";
  case TickOutcome::READ_FAILED:
    return "READ_FAILED";
  case TickOutcome::NO_VFS:
    return "NO_VFS";
  case TickOutcome::NO_SLAVE:
    return "NO_SLAVE";
  case TickOutcome::NOT_BOND_SLAVE:
    return "NOT_BOND_SLAVE";
  case TickOutcome::MALFORMED_SLAVE:
    return "MALFORMED_SLAVE";
  }
  return "UNKNOWN";
}

/* ----------------------------- LacpMonitor ----------------------------- */

LacpMonitor::LacpMonitor(int pfIndex, std::string pfName, link::LinkAttributeSource& links,
                         link::VfControl& vfControl, std::shared_ptr<spdlog::logger> log)
    : pfIndex_(pfIndex), pfName_(std::move(pfName)), links_(links), vfControl_(vfControl),
      log_(std::move(log)) {}

TickOutcome LacpMonitor::tick() {
  link::LinkAttributes attrs{};
  std::string error;
  if (!links_.resolveByIndex(pfIndex_, attrs, error)) {
    log_->warn("failed to fetch interface interface={} error={}", pfName_, error);
    return TickOutcome::READ_FAILED;
  }

  if (attrs.vfs.empty()) {
    if (logNoVfs_) {
      log_->info("interface has no VFs interface={}", pfName_);
      logNoVfs_ = false;
    }
    return TickOutcome::NO_VFS;
  }
  logNoVfs_ = true;

  if (std::holds_alternative<link::NoSlave>(attrs.slave)) {
    log_->error("interface has no slave attribute interface={}", pfName_);
    return TickOutcome::NO_SLAVE;
  }

  if (const auto* bad = std::get_if<link::MalformedSlave>(&attrs.slave)) {
    log_->error("failed to read lacp port state interface={} error={}", pfName_, bad->reason);
    return TickOutcome::MALFORMED_SLAVE;
  }

  const auto* bond = std::get_if<link::BondSlave>(&attrs.slave);
  if (bond == nullptr) {
    log_->error("interface is not a bond slave interface={} slave={}", pfName_,
                std::get<link::OtherSlave>(attrs.slave).kind);
    return TickOutcome::NOT_BOND_SLAVE;
  }

  if (link::isProtocolUp(*bond)) {
    if (!lacpUp_) {
      log_->info("lacp is up interface={}", pfName_);
      lacpUp_ = true;

      if (!link::isFastRate(*bond)) {
        log_->warn("partner is using slow lacp rate interface={}", pfName_);
      }
    }
    bringUp(attrs.vfs);
  } else {
    if (lacpUp_ || firstDownLog_) {
      log_->info("lacp is down interface={} actor=[{}] partner=[{}]", pfName_,
                 link::formatPortState(bond->actorOperPortState),
                 link::formatPortState(bond->partnerOperPortState));
      lacpUp_ = false;
      firstDownLog_ = false;
    }
    bringDown(attrs.vfs);
  }

  return TickOutcome::RECONCILED;
}

void LacpMonitor::bringUp(const std::vector<link::VfInfo>& vfs) {
  for (const link::VfInfo& vf : vfs) {
    log_->debug("vf info id={} state={} interface={}", vf.id, link::toString(vf.linkState),
                pfName_);
    if (vf.linkState == link::VfLinkState::DISABLE) {
      setVf(vf.id, link::VfLinkState::AUTO);
    }
  }
}

void LacpMonitor::bringDown(const std::vector<link::VfInfo>& vfs) {
  for (const link::VfInfo& vf : vfs) {
    log_->debug("vf info id={} state={} interface={}", vf.id, link::toString(vf.linkState),
                pfName_);
    if (vf.linkState == link::VfLinkState::AUTO) {
      setVf(vf.id, link::VfLinkState::DISABLE);
    }
  }
}

void LacpMonitor::setVf(std::uint32_t vfId, link::VfLinkState state) {
  std::string error;
  if (!vfControl_.setVfLinkState(pfIndex_, vfId, state, error)) {
    log_->error("failed to set vf link state id={} state={} interface={} error={}", vfId,
                link::toString(state), pfName_, error);
    return;
  }
  log_->info("vf link state was set id={} state={} interface={}", vfId, link::toString(state),
             pfName_);
}

/* ----------------------------- PhysicalFunction ----------------------------- */

PhysicalFunction::PhysicalFunction(const link::LinkAttributes& attrs,
                                   std::chrono::milliseconds pollingInterval,
                                   link::LinkAttributeSource& links, link::VfControl& vfControl,
                                   std::shared_ptr<spdlog::logger> log)
    : name_(attrs.name), index_(attrs.index), operState_(attrs.operState),
      masterIndex_(attrs.masterIndex), pollingInterval_(pollingInterval), links_(links),
      vfControl_(vfControl), log_(std::move(log)) {}

PhysicalFunction::~PhysicalFunction() { stopMonitoring(); }

InspectResult PhysicalFunction::inspect() const {
  if (operState_ != link::OperState::UP) {
    return {InspectStatus::LINK_NOT_UP, "link is not up"};
  }

  if (masterIndex_ == 0) {
    return {InspectStatus::NO_MASTER, "no master interface associated"};
  }

  link::BondInfo bond{};
  std::string error;
  if (!links_.resolveMaster(masterIndex_, bond, error)) {
    return {InspectStatus::MASTER_UNRESOLVED,
            fmt::format("failed to fetch master interface with index {}: {}", masterIndex_,
                        error)};
  }

  if (bond.mode == link::BondMode::NOT_A_BOND) {
    return {InspectStatus::NOT_LACP_BOND, fmt::format("master {} is not a bond", bond.name)};
  }

  if (bond.mode != link::BondMode::IEEE_802_3AD) {
    return {InspectStatus::NOT_LACP_BOND,
            fmt::format("bond {} does not have mode 802.3ad (mode {})", bond.name,
                        link::toString(bond.mode))};
  }

  return {};
}

UpdateStatus PhysicalFunction::update(std::string& error) {
  // Re-read rather than trusting the notification payload, which may be stale
  link::LinkAttributes attrs{};
  if (!links_.resolveByIndex(index_, attrs, error)) {
    return UpdateStatus::LOOKUP_FAILED;
  }

  log_->debug("link state interface={} state={}", attrs.name, link::toString(attrs.operState));

  if (attrs.operState == operState_) {
    log_->debug("PF was not updated interface={}", attrs.name);
    return UpdateStatus::UNCHANGED;
  }

  name_ = attrs.name;
  index_ = attrs.index;
  operState_ = attrs.operState;
  masterIndex_ = attrs.masterIndex;

  log_->info("PF was updated interface={} state={}", name_, link::toString(operState_));
  return UpdateStatus::CHANGED;
}

void PhysicalFunction::startMonitoring(const runtime::CancelScope& parent) {
  if (monitoring_) {
    log_->debug("lacp monitoring has already started interface={}", name_);
    return;
  }

  log_->info("starting lacp monitoring interface={}", name_);

  runtime::CancelScope scope = parent.child();
  LacpMonitor monitor(index_, name_, links_, vfControl_, log_);
  worker_ = std::thread(&PhysicalFunction::runMonitor, this, scope, std::move(monitor), name_);
  scope_.emplace(std::move(scope));
  monitoring_ = true;
}

void PhysicalFunction::stopMonitoring() {
  if (!monitoring_) {
    return;
  }

  log_->info("stopping lacp monitoring interface={}", name_);
  scope_->cancel();
  if (worker_.joinable()) {
    worker_.join();
  }
  scope_.reset();
  monitoring_ = false;
}

void PhysicalFunction::runMonitor(runtime::CancelScope scope, LacpMonitor monitor,
                                  std::string name) const {
  while (!scope.waitFor(pollingInterval_)) {
    const TickOutcome OUTCOME = monitor.tick();
    log_->trace("monitoring tick interface={} outcome={}", name, toString(OUTCOME));
  }
  log_->debug("ctx cancelled routine=monitoring interface={}", name);
}

} // namespace lacp

} // namespace pfrelay
