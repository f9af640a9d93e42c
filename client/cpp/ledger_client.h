#pragma once

#include <grpcpp/channel.h>
#include <grpcpp/support/status.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "acp/ledger/v1_grpc.hpp"

namespace acp::client {

/*
  LedgerClient

  Acts on the ledger as one identity. Tip, BatchTip and CreateBounty
  first read the caller's allowance towards the relevant ledger account
  and approve the exact amount needed when it is insufficient.
*/
class LedgerClient {
 public:
  LedgerClient(std::shared_ptr<::grpc::Channel> channel, std::string identity);

  const std::string& Identity() const {
    return identity_;
  }

  // Fetched once and cached.
  ::grpc::Status GetTokenInfo(acp::ledger::v1::TokenInfo* out);

  ::grpc::Status Balance(const std::string& identity, uint64_t* out) const;
  ::grpc::Status Allowances(const std::string& identity, acp::ledger::v1::GetAllowancesResponse* out) const;
  ::grpc::Status Faucet(uint64_t whole_tokens, acp::ledger::v1::FaucetResponse* out) const;
  ::grpc::Status Approve(const std::string& spender, uint64_t amount) const;

  ::grpc::Status Tip(const std::string& recipient, uint64_t amount, const std::string& post_ref, const std::string& message,
                     acp::ledger::v1::TipResponse* out);
  ::grpc::Status BatchTip(const std::vector<std::pair<std::string, uint64_t>>& entries, acp::ledger::v1::BatchTipResponse* out);
  ::grpc::Status GetTipStats(const std::string& identity, acp::ledger::v1::TipStats* out) const;

  ::grpc::Status CreateBounty(uint64_t amount, uint64_t deadline, const std::string& description, const std::string& external_ref,
                              uint64_t* bounty_id);
  ::grpc::Status ApproveClaim(uint64_t bounty_id, const std::string& claimer, const std::string& proof,
                              acp::ledger::v1::ApproveClaimResponse* out) const;
  ::grpc::Status CancelBounty(uint64_t bounty_id, acp::ledger::v1::Bounty* out) const;
  ::grpc::Status ClaimExpired(uint64_t bounty_id, acp::ledger::v1::Bounty* out) const;
  ::grpc::Status GetBounty(uint64_t bounty_id, acp::ledger::v1::Bounty* out) const;
  ::grpc::Status ListActiveBounties(uint64_t offset, uint64_t limit, std::vector<acp::ledger::v1::Bounty>* out) const;
  ::grpc::Status PosterBounties(const std::string& identity, std::vector<uint64_t>* out) const;
  ::grpc::Status ClaimerBounties(const std::string& identity, std::vector<uint64_t>* out) const;
  ::grpc::Status GetBountyStats(const std::string& identity, acp::ledger::v1::BountyStats* out) const;

  ::grpc::Status RegisterAgent(const std::string& name, const std::string& profile) const;
  ::grpc::Status GetAgentProfile(const std::string& identity, acp::ledger::v1::AgentProfile* out) const;
  ::grpc::Status ReadEvents(const acp::ledger::v1::ReadEventsRequest& request, acp::ledger::v1::ReadEventsResponse* out) const;

 private:
  ::grpc::Status EnsureAllowance(const std::string& spender, uint64_t needed) const;

  std::string identity_;
  std::optional<acp::ledger::v1::TokenInfo> token_info_;

  std::unique_ptr<acp::ledger::v1::TipService::Stub>      tip_stub_;
  std::unique_ptr<acp::ledger::v1::BountyService::Stub>   bounty_stub_;
  std::unique_ptr<acp::ledger::v1::RegistryService::Stub> registry_stub_;
  std::unique_ptr<acp::ledger::v1::TokenService::Stub>    token_stub_;
};

} // namespace acp::client
