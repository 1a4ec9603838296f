/**
 * @file LacpPortState.cpp
 * @brief 802.1AX port-state decoding.
 */

#include "src/link/inc/LacpPortState.hpp"

namespace pfrelay {

namespace link {

bool isProtocolUp(const BondSlave& slave) noexcept {
  const std::uint8_t ACTOR = slave.actorOperPortState;
  const std::uint8_t PARTNER = slave.partnerOperPortState;

  if ((ACTOR & (LACP_STATE_DEFAULTED | LACP_STATE_EXPIRED)) != 0) {
    return false;
  }

  return (ACTOR & LACP_STATE_IN_SERVICE) == LACP_STATE_IN_SERVICE &&
         (PARTNER & LACP_STATE_IN_SERVICE) == LACP_STATE_IN_SERVICE;
}

bool isFastRate(const BondSlave& slave) noexcept {
  return (slave.partnerOperPortState & LACP_STATE_SHORT_TIMEOUT) != 0;
}

std::string formatPortState(std::uint8_t state) {
  static constexpr struct {
    std::uint8_t bit;
    const char* name;
  } FLAGS[] = {
      {LACP_STATE_ACTIVITY, "ACT"},       {LACP_STATE_SHORT_TIMEOUT, "TMO"},
      {LACP_STATE_AGGREGATION, "AGG"},    {LACP_STATE_SYNCHRONIZATION, "SYNC"},
      {LACP_STATE_COLLECTING, "COL"},     {LACP_STATE_DISTRIBUTING, "DIST"},
      {LACP_STATE_DEFAULTED, "DEF"},      {LACP_STATE_EXPIRED, "EXP"},
  };

  std::string out;
  for (const auto& FLAG : FLAGS) {
    if ((state & FLAG.bit) == 0) {
      continue;
    }
    if (!out.empty()) {
      out += '|';
    }
    out += FLAG.name;
  }
  return out.empty() ? "none" : out;
}

} // namespace link

} // namespace pfrelay
