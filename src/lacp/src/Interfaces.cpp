/**
 * @file Interfaces.cpp
 * @brief PF registry construction and link-change dispatch.
 */

#include "src/lacp/inc/Interfaces.hpp"

#include <functional>
#include <optional>
#include <utility>

namespace pfrelay {

namespace lacp {

Interfaces::Interfaces(const std::vector<std::string>& names,
                       std::chrono::milliseconds pollingInterval, link::LinkAttributeSource& links,
                       link::VfControl& vfControl, std::shared_ptr<spdlog::logger> log)
    : log_(std::move(log)) {
  for (const std::string& name : names) {
    link::LinkAttributes attrs{};
    std::string error;
    if (!links.resolveByName(name, attrs, error)) {
      log_->warn("failed to fetch interface interface={} error={}", name, error);
      continue;
    }

    if (pfs_.count(attrs.index) != 0) {
      log_->debug("interface already added interface={} index={}", name, attrs.index);
      continue;
    }

    log_->debug("adding interface {}", attrs.toString());
    pfs_.emplace(attrs.index, std::make_unique<PhysicalFunction>(attrs, pollingInterval, links,
                                                                 vfControl, log_));
  }
}

Interfaces::~Interfaces() {
  root_.cancel();
  wait();
}

std::vector<int> Interfaces::indexes() const {
  std::vector<int> out;
  out.reserve(pfs_.size());
  for (const auto& KV : pfs_) {
    out.push_back(KV.first);
  }
  return out;
}

PhysicalFunction* Interfaces::find(int index) const noexcept {
  auto it = pfs_.find(index);
  return it == pfs_.end() ? nullptr : it->second.get();
}

void Interfaces::start(const runtime::CancelScope& root, link::NotificationQueue& queue) {
  root_ = root.child();

  for (auto& kv : pfs_) {
    PhysicalFunction& pf = *kv.second;
    const InspectResult RESULT = pf.inspect();
    if (!RESULT.ok()) {
      log_->error("interface not ready interface={} reason={}", pf.name(), RESULT.message);
      continue;
    }
    pf.startMonitoring(root_);
  }

  dispatcher_ = std::thread(&Interfaces::dispatch, this, root_, std::ref(queue));
}

void Interfaces::processEvent(int index) {
  PhysicalFunction* pf = find(index);
  if (pf == nullptr) {
    log_->debug("ignoring event for unknown interface index={}", index);
    return;
  }

  std::string error;
  const UpdateStatus STATUS = pf->update(error);
  log_->debug("link change interface={} update={}", pf->name(), toString(STATUS));
  if (STATUS == UpdateStatus::LOOKUP_FAILED) {
    log_->error("failed to update link interface={} error={}", pf->name(), error);
    return;
  }
  if (STATUS == UpdateStatus::UNCHANGED) {
    return;
  }

  const InspectResult RESULT = pf->inspect();
  if (!RESULT.ok()) {
    log_->error("interface not ready interface={} reason={}", pf->name(), RESULT.message);
    pf->stopMonitoring();
    return;
  }
  pf->startMonitoring(root_);
}

void Interfaces::stopAll() {
  for (auto& kv : pfs_) {
    kv.second->stopMonitoring();
  }
}

void Interfaces::wait() {
  if (dispatcher_.joinable()) {
    dispatcher_.join();
  }
}

void Interfaces::dispatch(runtime::CancelScope root, link::NotificationQueue& queue) {
  while (true) {
    std::optional<int> index = queue.pop(root);
    if (!index) {
      break;
    }
    processEvent(*index);
  }

  log_->debug("ctx cancelled routine=dispatch");
  stopAll();
}

} // namespace lacp

} // namespace pfrelay
