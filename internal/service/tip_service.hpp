#pragma once

#include "acp/ledger/v1.hpp"
#include "service_context.hpp"

namespace acp::service {

class TipService {
public:
  explicit TipService(ServiceContext ctx);

  acp::ledger::v1::TipResponse
  Tip(const acp::ledger::v1::TipRequest& req);

  acp::ledger::v1::BatchTipResponse
  BatchTip(const acp::ledger::v1::BatchTipRequest& req);

  acp::ledger::v1::GetTipStatsResponse
  GetTipStats(const acp::ledger::v1::GetTipStatsRequest& req);

private:
  ServiceContext ctx_;
};

}
