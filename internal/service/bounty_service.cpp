#include "bounty_service.hpp"

#include <algorithm>

#include "internal/core/bounty_escrow.hpp"
#include "observe_rpc.hpp"

namespace acp::service {

using namespace acp::ledger::v1;

BountyService::BountyService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateBountyResponse BountyService::CreateBounty(const CreateBountyRequest& req) {
  return ObserveRpc("BountyService.CreateBounty", req.caller(), [&] {
    CreateBountyResponse resp;
    resp.set_bounty_id(ctx_.bounties->CreateBounty(req.caller(), req.amount(), req.deadline(), req.description(), req.external_ref()));
    return resp;
  });
}

ApproveClaimResponse BountyService::ApproveClaim(const ApproveClaimRequest& req) {
  return ObserveRpc("BountyService.ApproveClaim", req.caller(), [&] {
    ApproveClaimResponse resp;
    *resp.mutable_bounty() = ctx_.bounties->ApproveClaim(req.caller(), req.bounty_id(), req.claimer(), req.proof());
    resp.set_status(resp.bounty().status());
    return resp;
  });
}

CancelBountyResponse BountyService::CancelBounty(const CancelBountyRequest& req) {
  return ObserveRpc("BountyService.CancelBounty", req.caller(), [&] {
    CancelBountyResponse resp;
    *resp.mutable_bounty() = ctx_.bounties->CancelBounty(req.caller(), req.bounty_id());
    return resp;
  });
}

ClaimExpiredResponse BountyService::ClaimExpired(const ClaimExpiredRequest& req) {
  return ObserveRpc("BountyService.ClaimExpired", req.caller(), [&] {
    ClaimExpiredResponse resp;
    *resp.mutable_bounty() = ctx_.bounties->ClaimExpired(req.caller(), req.bounty_id());
    return resp;
  });
}

GetBountyResponse BountyService::GetBounty(const GetBountyRequest& req) {
  return ObserveRpc("BountyService.GetBounty", "", [&] {
    GetBountyResponse resp;
    *resp.mutable_bounty() = ctx_.bounties->GetBounty(req.bounty_id());
    return resp;
  });
}

GetPosterBountiesResponse BountyService::GetPosterBounties(const GetPosterBountiesRequest& req) {
  return ObserveRpc("BountyService.GetPosterBounties", "", [&] {
    GetPosterBountiesResponse resp;
    for (uint64_t id : ctx_.bounties->GetPosterBounties(req.identity())) {
      resp.add_bounty_ids(id);
    }
    return resp;
  });
}

GetClaimerBountiesResponse BountyService::GetClaimerBounties(const GetClaimerBountiesRequest& req) {
  return ObserveRpc("BountyService.GetClaimerBounties", "", [&] {
    GetClaimerBountiesResponse resp;
    for (uint64_t id : ctx_.bounties->GetClaimerBounties(req.identity())) {
      resp.add_bounty_ids(id);
    }
    return resp;
  });
}

ListActiveBountiesResponse BountyService::ListActiveBounties(const ListActiveBountiesRequest& req) {
  return ObserveRpc("BountyService.ListActiveBounties", "", [&] {
    const uint64_t limit = req.limit() == 0 ? kDefaultActivePageSize : std::min(req.limit(), kMaxActivePageSize);

    ListActiveBountiesResponse resp;
    for (auto& bounty : ctx_.bounties->GetActiveBounties(req.offset(), limit)) {
      *resp.add_bounties() = std::move(bounty);
    }
    return resp;
  });
}

GetBountyStatsResponse BountyService::GetBountyStats(const GetBountyStatsRequest& req) {
  return ObserveRpc("BountyService.GetBountyStats", "", [&] {
    GetBountyStatsResponse resp;
    *resp.mutable_stats() = ctx_.bounties->GetAgentStats(req.identity());
    return resp;
  });
}

}
