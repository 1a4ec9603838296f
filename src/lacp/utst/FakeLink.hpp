#ifndef PFRELAY_LACP_UTST_FAKE_LINK_HPP
#define PFRELAY_LACP_UTST_FAKE_LINK_HPP
/**
 * @file FakeLink.hpp
 * @brief In-memory link collaborators and log capture for lacp tests.
 * @note Thread-safe: monitors poll from their own threads while tests mutate.
 *
 * FakeVfControl writes through to FakeLinks, so a VF set to "auto" reads back
 * as "auto" on the next tick, the way the kernel behaves.
 */

#include "src/link/inc/LacpPortState.hpp"
#include "src/link/inc/LinkSource.hpp"
#include "src/link/inc/LinkTypes.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/sinks/ringbuffer_sink.h>

namespace pfrelay {

namespace lacp {

namespace test {

/* ----------------------------- Constants ----------------------------- */

/// Port state of a healthy aggregated port: ACT|AGG|SYNC|COL|DIST.
inline constexpr std::uint8_t PORT_IN_SYNC = link::LACP_STATE_ACTIVITY |
                                             link::LACP_STATE_AGGREGATION |
                                             link::LACP_STATE_IN_SERVICE;

/// Same with the fast-rate bit, as a partner configured for "lacp rate fast" reports it.
inline constexpr std::uint8_t PORT_IN_SYNC_FAST = PORT_IN_SYNC | link::LACP_STATE_SHORT_TIMEOUT;

/// Port state of a port whose partner went silent: ACT|AGG|DEF.
inline constexpr std::uint8_t PORT_DEFAULTED =
    link::LACP_STATE_ACTIVITY | link::LACP_STATE_AGGREGATION | link::LACP_STATE_DEFAULTED;

/* ----------------------------- Builders ----------------------------- */

inline link::BondSlave lacpUpSlave() { return link::BondSlave{PORT_IN_SYNC, PORT_IN_SYNC_FAST}; }

inline link::BondSlave lacpDownSlave() { return link::BondSlave{PORT_DEFAULTED, 0}; }

/// PF attributes with the given VF states, ids 0..n-1.
inline link::LinkAttributes makePf(std::string name, int index, link::OperState state,
                                   int masterIndex, link::SlaveInfo slave,
                                   const std::vector<link::VfLinkState>& vfStates) {
  link::LinkAttributes attrs{};
  attrs.name = std::move(name);
  attrs.index = index;
  attrs.operState = state;
  attrs.masterIndex = masterIndex;
  attrs.slave = std::move(slave);
  for (std::size_t i = 0; i < vfStates.size(); ++i) {
    attrs.vfs.push_back(link::VfInfo{static_cast<std::uint32_t>(i), vfStates[i]});
  }
  return attrs;
}

/* ----------------------------- FakeLinks ----------------------------- */

class FakeLinks final : public link::LinkAttributeSource {
public:
  void setLink(const link::LinkAttributes& attrs) {
    std::lock_guard<std::mutex> lock(mtx_);
    links_[attrs.index] = attrs;
  }

  void setMaster(int index, link::BondInfo info) {
    std::lock_guard<std::mutex> lock(mtx_);
    masters_[index] = std::move(info);
  }

  void setOperState(int index, link::OperState state) {
    std::lock_guard<std::mutex> lock(mtx_);
    links_[index].operState = state;
  }

  void setMasterIndex(int index, int masterIndex) {
    std::lock_guard<std::mutex> lock(mtx_);
    links_[index].masterIndex = masterIndex;
  }

  void setSlave(int index, link::SlaveInfo slave) {
    std::lock_guard<std::mutex> lock(mtx_);
    links_[index].slave = std::move(slave);
  }

  void setVfs(int index, const std::vector<link::VfLinkState>& states) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto& vfs = links_[index].vfs;
    vfs.clear();
    for (std::size_t i = 0; i < states.size(); ++i) {
      vfs.push_back(link::VfInfo{static_cast<std::uint32_t>(i), states[i]});
    }
  }

  /// Make lookups of an index fail until cleared.
  void setLookupFails(int index, bool fail) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (fail) {
      failing_.insert(index);
    } else {
      failing_.erase(index);
    }
  }

  [[nodiscard]] link::VfLinkState vfState(int index, std::uint32_t vfId) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = links_.find(index);
    if (it == links_.end()) {
      return link::VfLinkState::UNKNOWN;
    }
    for (const link::VfInfo& vf : it->second.vfs) {
      if (vf.id == vfId) {
        return vf.linkState;
      }
    }
    return link::VfLinkState::UNKNOWN;
  }

  /// Apply a VF write; false if the PF or VF does not exist.
  bool applyVf(int index, std::uint32_t vfId, link::VfLinkState state) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = links_.find(index);
    if (it == links_.end()) {
      return false;
    }
    for (link::VfInfo& vf : it->second.vfs) {
      if (vf.id == vfId) {
        vf.linkState = state;
        return true;
      }
    }
    return false;
  }

  [[nodiscard]] std::size_t lookupsByIndex() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return lookupsByIndex_;
  }

  bool resolveByName(const std::string& name, link::LinkAttributes& out,
                     std::string& error) override {
    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& KV : links_) {
      if (KV.second.name == name) {
        if (failing_.count(KV.first) != 0) {
          error = "injected lookup failure";
          return false;
        }
        out = KV.second;
        return true;
      }
    }
    error = "Link not found";
    return false;
  }

  bool resolveByIndex(int index, link::LinkAttributes& out, std::string& error) override {
    std::lock_guard<std::mutex> lock(mtx_);
    ++lookupsByIndex_;
    if (failing_.count(index) != 0) {
      error = "injected lookup failure";
      return false;
    }
    auto it = links_.find(index);
    if (it == links_.end()) {
      error = "Link not found";
      return false;
    }
    out = it->second;
    return true;
  }

  bool resolveMaster(int masterIndex, link::BondInfo& out, std::string& error) override {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = masters_.find(masterIndex);
    if (it == masters_.end()) {
      error = "Link not found";
      return false;
    }
    out = it->second;
    return true;
  }

private:
  mutable std::mutex mtx_;
  std::map<int, link::LinkAttributes> links_;
  std::map<int, link::BondInfo> masters_;
  std::set<int> failing_;
  std::size_t lookupsByIndex_{0};
};

/* ----------------------------- FakeVfControl ----------------------------- */

struct VfWrite {
  int pfIndex;
  std::uint32_t vfId;
  link::VfLinkState state;
};

class FakeVfControl final : public link::VfControl {
public:
  explicit FakeVfControl(FakeLinks& links) : links_(links) {}

  /// Reject writes to one VF until cleared.
  void setWriteFails(std::uint32_t vfId, bool fail) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (fail) {
      failing_.insert(vfId);
    } else {
      failing_.erase(vfId);
    }
  }

  [[nodiscard]] std::vector<VfWrite> writes() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return writes_;
  }

  bool setVfLinkState(int pfIndex, std::uint32_t vfId, link::VfLinkState state,
                      std::string& error) override {
    std::lock_guard<std::mutex> lock(mtx_);
    if (failing_.count(vfId) != 0) {
      error = "Operation not supported";
      return false;
    }
    if (!links_.applyVf(pfIndex, vfId, state)) {
      error = "No such device";
      return false;
    }
    writes_.push_back(VfWrite{pfIndex, vfId, state});
    return true;
  }

private:
  FakeLinks& links_;
  mutable std::mutex mtx_;
  std::set<std::uint32_t> failing_;
  std::vector<VfWrite> writes_;
};

/* ----------------------------- LogCapture ----------------------------- */

/**
 * @brief Logger backed by a ring buffer so tests can count emitted lines.
 */
class LogCapture {
public:
  LogCapture()
      : sink_(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(CAPACITY)),
        log_(std::make_shared<spdlog::logger>("pfrelay-test", sink_)) {
    log_->set_pattern("%l %v");
    log_->set_level(spdlog::level::trace);
  }

  [[nodiscard]] const std::shared_ptr<spdlog::logger>& logger() const noexcept { return log_; }

  /// Lines containing the given text.
  [[nodiscard]] std::size_t count(std::string_view text) const {
    const std::vector<std::string> LINES = sink_->last_formatted();
    return static_cast<std::size_t>(
        std::count_if(LINES.begin(), LINES.end(), [text](const std::string& line) {
          return line.find(text) != std::string::npos;
        }));
  }

private:
  static constexpr std::size_t CAPACITY = 4096;

  std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
  std::shared_ptr<spdlog::logger> log_;
};

/* ----------------------------- Helpers ----------------------------- */

/// Poll a condition until it holds or the timeout expires.
template <typename Pred>
bool waitUntil(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
  const auto DEADLINE = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < DEADLINE) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return pred();
}

} // namespace test

} // namespace lacp

} // namespace pfrelay

#endif // PFRELAY_LACP_UTST_FAKE_LINK_HPP
