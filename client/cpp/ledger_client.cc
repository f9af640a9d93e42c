#include "client/cpp/ledger_client.h"

#include <grpcpp/client_context.h>

#include <limits>

namespace acp::client {

using namespace acp::ledger::v1;

LedgerClient::LedgerClient(std::shared_ptr<::grpc::Channel> channel, std::string identity)
    : identity_(std::move(identity)),
      tip_stub_(TipService::NewStub(channel)),
      bounty_stub_(BountyService::NewStub(channel)),
      registry_stub_(RegistryService::NewStub(channel)),
      token_stub_(TokenService::NewStub(channel)) {
}

::grpc::Status LedgerClient::GetTokenInfo(acp::ledger::v1::TokenInfo* out) {
  if (!token_info_) {
    ::grpc::ClientContext ctx;
    GetTokenInfoResponse  resp;
    auto                  status = token_stub_->GetTokenInfo(&ctx, GetTokenInfoRequest{}, &resp);
    if (!status.ok()) {
      return status;
    }
    token_info_ = resp.info();
  }
  *out = *token_info_;
  return ::grpc::Status::OK;
}

::grpc::Status LedgerClient::Balance(const std::string& identity, uint64_t* out) const {
  ::grpc::ClientContext ctx;
  GetBalanceRequest     req;
  GetBalanceResponse    resp;
  req.set_identity(identity);
  auto status = registry_stub_->GetBalance(&ctx, req, &resp);
  if (status.ok()) {
    *out = resp.balance();
  }
  return status;
}

::grpc::Status LedgerClient::Allowances(const std::string& identity, GetAllowancesResponse* out) const {
  ::grpc::ClientContext ctx;
  GetAllowancesRequest  req;
  req.set_identity(identity);
  return registry_stub_->GetAllowances(&ctx, req, out);
}

::grpc::Status LedgerClient::Faucet(uint64_t whole_tokens, FaucetResponse* out) const {
  ::grpc::ClientContext ctx;
  FaucetRequest         req;
  req.set_caller(identity_);
  req.set_whole_tokens(whole_tokens);
  return token_stub_->Faucet(&ctx, req, out);
}

::grpc::Status LedgerClient::Approve(const std::string& spender, uint64_t amount) const {
  ::grpc::ClientContext ctx;
  ApproveRequest        req;
  ApproveResponse       resp;
  req.set_caller(identity_);
  req.set_spender(spender);
  req.set_amount(amount);
  return token_stub_->Approve(&ctx, req, &resp);
}

::grpc::Status LedgerClient::EnsureAllowance(const std::string& spender, uint64_t needed) const {
  ::grpc::ClientContext ctx;
  GetAllowancesRequest  req;
  GetAllowancesResponse resp;
  req.set_identity(identity_);
  auto status = registry_stub_->GetAllowances(&ctx, req, &resp);
  if (!status.ok()) {
    return status;
  }

  const uint64_t current = spender == token_info_->tips_account() ? resp.tips_allowance() : resp.bounties_allowance();
  if (current >= needed) {
    return ::grpc::Status::OK;
  }
  return Approve(spender, needed);
}

::grpc::Status LedgerClient::Tip(const std::string& recipient, uint64_t amount, const std::string& post_ref,
                                 const std::string& message, TipResponse* out) {
  acp::ledger::v1::TokenInfo info;
  auto                       status = GetTokenInfo(&info);
  if (!status.ok()) return status;
  status = EnsureAllowance(info.tips_account(), amount);
  if (!status.ok()) return status;

  ::grpc::ClientContext ctx;
  TipRequest            req;
  req.set_caller(identity_);
  req.set_recipient(recipient);
  req.set_amount(amount);
  req.set_post_ref(post_ref);
  req.set_message(message);
  return tip_stub_->Tip(&ctx, req, out);
}

::grpc::Status LedgerClient::BatchTip(const std::vector<std::pair<std::string, uint64_t>>& entries, BatchTipResponse* out) {
  BatchTipRequest req;
  req.set_caller(identity_);
  uint64_t total = 0;
  for (const auto& [recipient, amount] : entries) {
    req.add_recipients(recipient);
    req.add_amounts(amount);
    if (amount > std::numeric_limits<uint64_t>::max() - total) {
      return {::grpc::StatusCode::INVALID_ARGUMENT, "batch tip total overflows"};
    }
    total += amount;
  }

  acp::ledger::v1::TokenInfo info;
  auto                       status = GetTokenInfo(&info);
  if (!status.ok()) return status;
  status = EnsureAllowance(info.tips_account(), total);
  if (!status.ok()) return status;

  ::grpc::ClientContext ctx;
  return tip_stub_->BatchTip(&ctx, req, out);
}

::grpc::Status LedgerClient::GetTipStats(const std::string& identity, acp::ledger::v1::TipStats* out) const {
  ::grpc::ClientContext ctx;
  GetTipStatsRequest    req;
  GetTipStatsResponse   resp;
  req.set_identity(identity);
  auto status = tip_stub_->GetTipStats(&ctx, req, &resp);
  if (status.ok()) {
    *out = resp.stats();
  }
  return status;
}

::grpc::Status LedgerClient::CreateBounty(uint64_t amount, uint64_t deadline, const std::string& description,
                                          const std::string& external_ref, uint64_t* bounty_id) {
  acp::ledger::v1::TokenInfo info;
  auto                       status = GetTokenInfo(&info);
  if (!status.ok()) return status;
  status = EnsureAllowance(info.escrow_account(), amount);
  if (!status.ok()) return status;

  ::grpc::ClientContext ctx;
  CreateBountyRequest   req;
  CreateBountyResponse  resp;
  req.set_caller(identity_);
  req.set_amount(amount);
  req.set_deadline(deadline);
  req.set_description(description);
  req.set_external_ref(external_ref);
  status = bounty_stub_->CreateBounty(&ctx, req, &resp);
  if (status.ok()) {
    *bounty_id = resp.bounty_id();
  }
  return status;
}

::grpc::Status LedgerClient::ApproveClaim(uint64_t bounty_id, const std::string& claimer, const std::string& proof,
                                          ApproveClaimResponse* out) const {
  ::grpc::ClientContext ctx;
  ApproveClaimRequest   req;
  req.set_caller(identity_);
  req.set_bounty_id(bounty_id);
  req.set_claimer(claimer);
  req.set_proof(proof);
  return bounty_stub_->ApproveClaim(&ctx, req, out);
}

::grpc::Status LedgerClient::CancelBounty(uint64_t bounty_id, Bounty* out) const {
  ::grpc::ClientContext ctx;
  CancelBountyRequest   req;
  CancelBountyResponse  resp;
  req.set_caller(identity_);
  req.set_bounty_id(bounty_id);
  auto status = bounty_stub_->CancelBounty(&ctx, req, &resp);
  if (status.ok()) {
    *out = resp.bounty();
  }
  return status;
}

::grpc::Status LedgerClient::ClaimExpired(uint64_t bounty_id, Bounty* out) const {
  ::grpc::ClientContext ctx;
  ClaimExpiredRequest   req;
  ClaimExpiredResponse  resp;
  req.set_caller(identity_);
  req.set_bounty_id(bounty_id);
  auto status = bounty_stub_->ClaimExpired(&ctx, req, &resp);
  if (status.ok()) {
    *out = resp.bounty();
  }
  return status;
}

::grpc::Status LedgerClient::GetBounty(uint64_t bounty_id, Bounty* out) const {
  ::grpc::ClientContext ctx;
  GetBountyRequest      req;
  GetBountyResponse     resp;
  req.set_bounty_id(bounty_id);
  auto status = bounty_stub_->GetBounty(&ctx, req, &resp);
  if (status.ok()) {
    *out = resp.bounty();
  }
  return status;
}

::grpc::Status LedgerClient::ListActiveBounties(uint64_t offset, uint64_t limit, std::vector<Bounty>* out) const {
  ::grpc::ClientContext      ctx;
  ListActiveBountiesRequest  req;
  ListActiveBountiesResponse resp;
  req.set_offset(offset);
  req.set_limit(limit);
  auto status = bounty_stub_->ListActiveBounties(&ctx, req, &resp);
  if (status.ok()) {
    out->assign(resp.bounties().begin(), resp.bounties().end());
  }
  return status;
}

::grpc::Status LedgerClient::PosterBounties(const std::string& identity, std::vector<uint64_t>* out) const {
  ::grpc::ClientContext     ctx;
  GetPosterBountiesRequest  req;
  GetPosterBountiesResponse resp;
  req.set_identity(identity);
  auto status = bounty_stub_->GetPosterBounties(&ctx, req, &resp);
  if (status.ok()) {
    out->assign(resp.bounty_ids().begin(), resp.bounty_ids().end());
  }
  return status;
}

::grpc::Status LedgerClient::ClaimerBounties(const std::string& identity, std::vector<uint64_t>* out) const {
  ::grpc::ClientContext      ctx;
  GetClaimerBountiesRequest  req;
  GetClaimerBountiesResponse resp;
  req.set_identity(identity);
  auto status = bounty_stub_->GetClaimerBounties(&ctx, req, &resp);
  if (status.ok()) {
    out->assign(resp.bounty_ids().begin(), resp.bounty_ids().end());
  }
  return status;
}

::grpc::Status LedgerClient::GetBountyStats(const std::string& identity, acp::ledger::v1::BountyStats* out) const {
  ::grpc::ClientContext  ctx;
  GetBountyStatsRequest  req;
  GetBountyStatsResponse resp;
  req.set_identity(identity);
  auto status = bounty_stub_->GetBountyStats(&ctx, req, &resp);
  if (status.ok()) {
    *out = resp.stats();
  }
  return status;
}

::grpc::Status LedgerClient::RegisterAgent(const std::string& name, const std::string& profile) const {
  ::grpc::ClientContext ctx;
  RegisterAgentRequest  req;
  RegisterAgentResponse resp;
  req.set_caller(identity_);
  req.set_name(name);
  req.set_profile(profile);
  return registry_stub_->RegisterAgent(&ctx, req, &resp);
}

::grpc::Status LedgerClient::GetAgentProfile(const std::string& identity, acp::ledger::v1::AgentProfile* out) const {
  ::grpc::ClientContext   ctx;
  GetAgentProfileRequest  req;
  GetAgentProfileResponse resp;
  req.set_identity(identity);
  auto status = registry_stub_->GetAgentProfile(&ctx, req, &resp);
  if (status.ok()) {
    *out = resp.profile();
  }
  return status;
}

::grpc::Status LedgerClient::ReadEvents(const ReadEventsRequest& request, ReadEventsResponse* out) const {
  ::grpc::ClientContext ctx;
  return registry_stub_->ReadEvents(&ctx, request, out);
}

} // namespace acp::client
