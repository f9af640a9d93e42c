#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "acp/ledger/v1_grpc.hpp"
#include "internal/service/bounty_service.hpp"

namespace acp::grpc {

class BountyServer final : public acp::ledger::v1::BountyService::Service {
public:
  explicit BountyServer(std::shared_ptr<acp::service::BountyService> svc);

  ::grpc::Status CreateBounty(::grpc::ServerContext*,
                   const acp::ledger::v1::CreateBountyRequest*,
                   acp::ledger::v1::CreateBountyResponse*) override;

  ::grpc::Status ApproveClaim(::grpc::ServerContext*,
                   const acp::ledger::v1::ApproveClaimRequest*,
                   acp::ledger::v1::ApproveClaimResponse*) override;

  ::grpc::Status CancelBounty(::grpc::ServerContext*,
                   const acp::ledger::v1::CancelBountyRequest*,
                   acp::ledger::v1::CancelBountyResponse*) override;

  ::grpc::Status ClaimExpired(::grpc::ServerContext*,
                   const acp::ledger::v1::ClaimExpiredRequest*,
                   acp::ledger::v1::ClaimExpiredResponse*) override;

  ::grpc::Status GetBounty(::grpc::ServerContext*,
                   const acp::ledger::v1::GetBountyRequest*,
                   acp::ledger::v1::GetBountyResponse*) override;

  ::grpc::Status GetPosterBounties(::grpc::ServerContext*,
                   const acp::ledger::v1::GetPosterBountiesRequest*,
                   acp::ledger::v1::GetPosterBountiesResponse*) override;

  ::grpc::Status GetClaimerBounties(::grpc::ServerContext*,
                   const acp::ledger::v1::GetClaimerBountiesRequest*,
                   acp::ledger::v1::GetClaimerBountiesResponse*) override;

  ::grpc::Status ListActiveBounties(::grpc::ServerContext*,
                   const acp::ledger::v1::ListActiveBountiesRequest*,
                   acp::ledger::v1::ListActiveBountiesResponse*) override;

  ::grpc::Status GetBountyStats(::grpc::ServerContext*,
                   const acp::ledger::v1::GetBountyStatsRequest*,
                   acp::ledger::v1::GetBountyStatsResponse*) override;

private:
  std::shared_ptr<acp::service::BountyService> service_;
};

}
