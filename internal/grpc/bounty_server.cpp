#include "bounty_server.hpp"
#include "grpc_error.hpp"

namespace acp::grpc {

using namespace acp::ledger::v1;

BountyServer::BountyServer(std::shared_ptr<acp::service::BountyService> svc)
    : service_(std::move(svc)) {}

::grpc::Status BountyServer::CreateBounty(::grpc::ServerContext*, const CreateBountyRequest* req, CreateBountyResponse* resp) {
  return Dispatch([&] { *resp = service_->CreateBounty(*req); });
}

::grpc::Status BountyServer::ApproveClaim(::grpc::ServerContext*, const ApproveClaimRequest* req, ApproveClaimResponse* resp) {
  return Dispatch([&] { *resp = service_->ApproveClaim(*req); });
}

::grpc::Status BountyServer::CancelBounty(::grpc::ServerContext*, const CancelBountyRequest* req, CancelBountyResponse* resp) {
  return Dispatch([&] { *resp = service_->CancelBounty(*req); });
}

::grpc::Status BountyServer::ClaimExpired(::grpc::ServerContext*, const ClaimExpiredRequest* req, ClaimExpiredResponse* resp) {
  return Dispatch([&] { *resp = service_->ClaimExpired(*req); });
}

::grpc::Status BountyServer::GetBounty(::grpc::ServerContext*, const GetBountyRequest* req, GetBountyResponse* resp) {
  return Dispatch([&] { *resp = service_->GetBounty(*req); });
}

::grpc::Status BountyServer::GetPosterBounties(::grpc::ServerContext*, const GetPosterBountiesRequest* req, GetPosterBountiesResponse* resp) {
  return Dispatch([&] { *resp = service_->GetPosterBounties(*req); });
}

::grpc::Status BountyServer::GetClaimerBounties(::grpc::ServerContext*, const GetClaimerBountiesRequest* req, GetClaimerBountiesResponse* resp) {
  return Dispatch([&] { *resp = service_->GetClaimerBounties(*req); });
}

::grpc::Status BountyServer::ListActiveBounties(::grpc::ServerContext*, const ListActiveBountiesRequest* req, ListActiveBountiesResponse* resp) {
  return Dispatch([&] { *resp = service_->ListActiveBounties(*req); });
}

::grpc::Status BountyServer::GetBountyStats(::grpc::ServerContext*, const GetBountyStatsRequest* req, GetBountyStatsResponse* resp) {
  return Dispatch([&] { *resp = service_->GetBountyStats(*req); });
}

}
