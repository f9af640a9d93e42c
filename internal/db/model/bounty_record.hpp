#pragma once

#include <cstdint>
#include <string>

#include "acp/ledger/v1.hpp"

namespace acp::db::model {

/*
  Persistent bounty row.

  IMPORTANT:
  - Immutable after insert except for the single terminal transition
    (status, claimed_by, claimed_at).
  - Rows are never deleted; ids are never reused.
*/

struct BountyRecord {
  uint64_t id = 0; // assigned by InsertBounty

  std::string poster;
  uint64_t    amount = 0;

  // Unix seconds (0 = none)
  uint64_t deadline = 0;

  std::string description;
  std::string external_ref;

  acp::ledger::v1::BountyStatus status = acp::ledger::v1::BOUNTY_STATUS_ACTIVE;

  std::string claimed_by;
  uint64_t    created_at = 0;
  uint64_t    claimed_at = 0;
};

}
