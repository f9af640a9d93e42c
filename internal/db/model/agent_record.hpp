#pragma once

#include <cstdint>
#include <string>

namespace acp::db::model {

struct AgentRecord {
  std::string identity;
  std::string name;
  std::string profile;
  uint64_t    updated_at = 0;
};

}
