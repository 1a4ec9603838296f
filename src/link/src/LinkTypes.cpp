/**
 * @file LinkTypes.cpp
 * @brief Conversions and formatting for link attribute snapshots.
 */

#include "src/link/inc/LinkTypes.hpp"
#include "src/link/inc/LacpPortState.hpp"

#include <fmt/core.h>

namespace pfrelay {

namespace link {

/* ----------------------------- OperState ----------------------------- */

const char* toString(OperState state) noexcept {
  switch (state) {
  case OperState::UNKNOWN:
    return "unknown";
  case OperState::NOT_PRESENT:
    return "notpresent";
  case OperState::DOWN:
    return "down";
  case OperState::LOWER_LAYER_DOWN:
    return "lowerlayerdown";
  case OperState::TESTING:
    return "testing";
  case OperState::DORMANT:
    return "dormant";
  case OperState::UP:
    return "up";
  }
  return "unknown";
}

OperState operStateFromRaw(std::uint32_t raw) noexcept {
  if (raw > static_cast<std::uint32_t>(OperState::UP)) {
    return OperState::UNKNOWN;
  }
  return static_cast<OperState>(raw);
}

/* ----------------------------- VfLinkState ----------------------------- */

const char* toString(VfLinkState state) noexcept {
  switch (state) {
  case VfLinkState::AUTO:
    return "auto";
  case VfLinkState::ENABLE:
    return "enable";
  case VfLinkState::DISABLE:
    return "disable";
  case VfLinkState::UNKNOWN:
    return "unknown";
  }
  return "unknown";
}

VfLinkState vfLinkStateFromRaw(std::uint32_t raw) noexcept {
  if (raw > static_cast<std::uint32_t>(VfLinkState::DISABLE)) {
    return VfLinkState::UNKNOWN;
  }
  return static_cast<VfLinkState>(raw);
}

/* ----------------------------- BondMode ----------------------------- */

const char* toString(BondMode mode) noexcept {
  switch (mode) {
  case BondMode::BALANCE_RR:
    return "balance-rr";
  case BondMode::ACTIVE_BACKUP:
    return "active-backup";
  case BondMode::BALANCE_XOR:
    return "balance-xor";
  case BondMode::BROADCAST:
    return "broadcast";
  case BondMode::IEEE_802_3AD:
    return "802.3ad";
  case BondMode::BALANCE_TLB:
    return "balance-tlb";
  case BondMode::BALANCE_ALB:
    return "balance-alb";
  case BondMode::NOT_A_BOND:
    return "not-a-bond";
  case BondMode::UNKNOWN:
    return "unknown";
  }
  return "unknown";
}

BondMode bondModeFromRaw(std::int32_t raw) noexcept {
  if (raw < 0 || raw > static_cast<std::int32_t>(BondMode::BALANCE_ALB)) {
    return BondMode::UNKNOWN;
  }
  return static_cast<BondMode>(raw);
}

/* ----------------------------- LinkAttributes ----------------------------- */

std::string LinkAttributes::toString() const {
  std::string out = fmt::format("{}: index={} state={} master={}", name, index,
                                link::toString(operState), masterIndex);

  if (const auto* bond = std::get_if<BondSlave>(&slave)) {
    out += fmt::format(" slave=bond actor=[{}] partner=[{}]",
                       formatPortState(bond->actorOperPortState),
                       formatPortState(bond->partnerOperPortState));
  } else if (const auto* other = std::get_if<OtherSlave>(&slave)) {
    out += fmt::format(" slave={}", other->kind);
  } else if (const auto* bad = std::get_if<MalformedSlave>(&slave)) {
    out += fmt::format(" slave=bond malformed=[{}]", bad->reason);
  }

  out += fmt::format(" vfs={}", vfs.size());
  return out;
}

} // namespace link

} // namespace pfrelay
