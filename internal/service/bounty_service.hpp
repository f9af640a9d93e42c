#pragma once

#include "acp/ledger/v1.hpp"
#include "service_context.hpp"

namespace acp::service {

// Default and maximum page size of ListActiveBounties.
inline constexpr uint64_t kDefaultActivePageSize = 20;
inline constexpr uint64_t kMaxActivePageSize     = 500;

class BountyService {
public:
  explicit BountyService(ServiceContext ctx);

  acp::ledger::v1::CreateBountyResponse
  CreateBounty(const acp::ledger::v1::CreateBountyRequest& req);

  acp::ledger::v1::ApproveClaimResponse
  ApproveClaim(const acp::ledger::v1::ApproveClaimRequest& req);

  acp::ledger::v1::CancelBountyResponse
  CancelBounty(const acp::ledger::v1::CancelBountyRequest& req);

  acp::ledger::v1::ClaimExpiredResponse
  ClaimExpired(const acp::ledger::v1::ClaimExpiredRequest& req);

  acp::ledger::v1::GetBountyResponse
  GetBounty(const acp::ledger::v1::GetBountyRequest& req);

  acp::ledger::v1::GetPosterBountiesResponse
  GetPosterBounties(const acp::ledger::v1::GetPosterBountiesRequest& req);

  acp::ledger::v1::GetClaimerBountiesResponse
  GetClaimerBounties(const acp::ledger::v1::GetClaimerBountiesRequest& req);

  acp::ledger::v1::ListActiveBountiesResponse
  ListActiveBounties(const acp::ledger::v1::ListActiveBountiesRequest& req);

  acp::ledger::v1::GetBountyStatsResponse
  GetBountyStats(const acp::ledger::v1::GetBountyStatsRequest& req);

private:
  ServiceContext ctx_;
};

}
