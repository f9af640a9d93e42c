#pragma once

#include "acp/ledger/core/v1/types.pb.h"
#include "acp/ledger/core/v1/events.pb.h"

#include "acp/ledger/services/v1/tip_service.pb.h"
#include "acp/ledger/services/v1/bounty_service.pb.h"
#include "acp/ledger/services/v1/registry_service.pb.h"
#include "acp/ledger/services/v1/token_service.pb.h"

namespace acp::ledger::v1 {
using namespace ::acp::ledger::core::v1;
using namespace ::acp::ledger::services::v1;
}
