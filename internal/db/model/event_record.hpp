#pragma once

#include <cstdint>
#include <string>

#include "acp/ledger/v1.hpp"

namespace acp::db::model {

/*
  Row of the append-only ledger event log.

  payload holds the serialized acp.ledger.core.v1.LedgerEvent. Its
  sequence field is left unset; readers take it from the row.
*/
struct EventRecord {
  uint64_t                   sequence = 0; // assigned by AppendEvent
  acp::ledger::v1::EventType type     = acp::ledger::v1::EVENT_TYPE_UNSPECIFIED;
  uint64_t                   timestamp = 0;
  std::string                payload;
};

}
