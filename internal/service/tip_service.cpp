#include "tip_service.hpp"

#include <string>
#include <vector>

#include "internal/core/tip_ledger.hpp"
#include "observe_rpc.hpp"

namespace acp::service {

using namespace acp::ledger::v1;

TipService::TipService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

TipResponse TipService::Tip(const TipRequest& req) {
  return ObserveRpc("TipService.Tip", req.caller(), [&] {
    auto receipt = ctx_.tips->Tip(req.caller(), req.recipient(), req.amount(), req.post_ref(), req.message());

    TipResponse resp;
    resp.set_event_sequence(receipt.event_sequence);
    return resp;
  });
}

BatchTipResponse TipService::BatchTip(const BatchTipRequest& req) {
  return ObserveRpc("TipService.BatchTip", req.caller(), [&] {
    std::vector<std::string> recipients(req.recipients().begin(), req.recipients().end());
    std::vector<uint64_t>    amounts(req.amounts().begin(), req.amounts().end());
    auto                     receipt = ctx_.tips->BatchTip(req.caller(), recipients, amounts);

    BatchTipResponse resp;
    resp.set_total_amount(receipt.total_amount);
    resp.set_event_sequence(receipt.event_sequence);
    return resp;
  });
}

GetTipStatsResponse TipService::GetTipStats(const GetTipStatsRequest& req) {
  return ObserveRpc("TipService.GetTipStats", "", [&] {
    GetTipStatsResponse resp;
    *resp.mutable_stats() = ctx_.tips->GetAgentStats(req.identity());
    return resp;
  });
}

}
