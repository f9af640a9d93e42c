#pragma once

#include "acp/ledger/v1.hpp"

namespace acp::model {

using acp::ledger::v1::BountyStatus;

constexpr bool IsTerminal(BountyStatus status) {
  return status == acp::ledger::v1::BOUNTY_STATUS_CLAIMED || status == acp::ledger::v1::BOUNTY_STATUS_EXPIRED ||
         status == acp::ledger::v1::BOUNTY_STATUS_CANCELLED;
}

// Active -> {Claimed | Expired | Cancelled}; nothing else ever fires.
constexpr bool CanTransition(BountyStatus from, BountyStatus to) {
  return from == acp::ledger::v1::BOUNTY_STATUS_ACTIVE && IsTerminal(to);
}

constexpr const char* StatusName(BountyStatus status) {
  switch (status) {
    case acp::ledger::v1::BOUNTY_STATUS_ACTIVE:
      return "Active";
    case acp::ledger::v1::BOUNTY_STATUS_CLAIMED:
      return "Claimed";
    case acp::ledger::v1::BOUNTY_STATUS_EXPIRED:
      return "Expired";
    case acp::ledger::v1::BOUNTY_STATUS_CANCELLED:
      return "Cancelled";
    default:
      return "Unspecified";
  }
}

} // namespace acp::model
