#pragma once

#include <cstdint>
#include <string>

namespace acp::db::model {

struct BountyStatsRecord {
  std::string identity;
  uint64_t    posted_count  = 0;
  uint64_t    claimed_count = 0;
  // includes bounties later cancelled or expired
  uint64_t amount_posted = 0;
  uint64_t amount_earned = 0;
};

}
