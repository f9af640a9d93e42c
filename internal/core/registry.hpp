#pragma once

#include <memory>
#include <string>

#include "acp/ledger/v1.hpp"
#include "internal/core/bounty_escrow.hpp"
#include "internal/core/ledger_context.hpp"
#include "internal/core/tip_ledger.hpp"

namespace acp::core {

using acp::ledger::v1::AgentProfile;

/*
  Registry

  Agent identity mapping plus read aggregation over the tip ledger and
  the bounty escrow.
*/
class Registry {
 public:
  Registry(LedgerContext ctx, std::shared_ptr<TipLedger> tips, std::shared_ptr<BountyEscrow> bounties);

  // Overwrites name and profile; registering again with the same values
  // changes nothing but still emits AgentRegistered.
  uint64_t RegisterAgent(const std::string& caller, const std::string& name, const std::string& profile);

  AgentProfile GetFullAgentStats(const std::string& identity);

  uint64_t GetBalance(const std::string& identity);
  uint64_t GetTipsAllowance(const std::string& identity);
  uint64_t GetBountiesAllowance(const std::string& identity);

  events::EventPage ReadEvents(uint64_t start_sequence, uint64_t max_entries, const events::EventFilter& filter);

 private:
  uint64_t AllowanceOf(const std::string& identity, const std::string& spender);

  LedgerContext                 ctx_;
  std::shared_ptr<TipLedger>    tips_;
  std::shared_ptr<BountyEscrow> bounties_;
};

} // namespace acp::core
