#pragma once

#include <cstdint>
#include <string>

namespace acp::db::model {

struct TipStatsRecord {
  std::string identity;
  uint64_t    total_received = 0;
  uint64_t    total_sent     = 0;
  uint64_t    received_count = 0;
};

}
