#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "acp/ledger/v1.hpp"
#include "internal/core/ledger_context.hpp"

namespace acp::core {

using acp::ledger::v1::Bounty;
using acp::ledger::v1::BountyStats;

/*
  BountyEscrow

  Holds bounty funds in custody from creation until exactly one of
  claim, cancellation or expiry. Only this class moves tokens into or
  out of the escrow account, so the escrow balance always equals the
  summed amount of Active bounties.

  Deadlines are compared against the sequencer's clock reading; a
  deadline "has passed" when now > deadline.
*/
class BountyEscrow {
 public:
  explicit BountyEscrow(LedgerContext ctx);

  uint64_t CreateBounty(const std::string& poster, uint64_t amount, uint64_t deadline, const std::string& description,
                        const std::string& external_ref);

  // Pays the claimer, or, when the deadline already passed, expires the
  // bounty and refunds the poster instead. Returns the bounty as stored.
  Bounty ApproveClaim(const std::string& caller, uint64_t bounty_id, const std::string& claimer, const std::string& proof);

  Bounty CancelBounty(const std::string& caller, uint64_t bounty_id);

  Bounty ClaimExpired(const std::string& caller, uint64_t bounty_id);

  Bounty GetBounty(uint64_t bounty_id);

  std::vector<uint64_t> GetPosterBounties(const std::string& identity);
  std::vector<uint64_t> GetClaimerBounties(const std::string& identity);

  // Active bounties whose deadline has not passed, ascending id.
  std::vector<Bounty> GetActiveBounties(uint64_t offset, uint64_t limit);

  BountyStats GetAgentStats(const std::string& identity);

  const std::string& Account() const {
    return ctx_.accounts.escrow;
  }

 private:
  db::model::BountyRecord LoadActiveForPoster(db::Transaction& tx, const std::string& caller, uint64_t bounty_id, const char* op);

  // Returns funds to the poster and records the terminal status.
  acp::ledger::v1::LedgerEvent Refund(db::Transaction& tx, db::model::BountyRecord& bounty, acp::ledger::v1::BountyStatus status,
                                      util::UnixSeconds now);

  void Transition(db::Transaction& tx, db::model::BountyRecord& bounty, acp::ledger::v1::BountyStatus to);

  db::model::BountyStatsRecord LoadStats(db::Transaction& tx, const std::string& identity);

  LedgerContext ctx_;
};

Bounty ToProto(const db::model::BountyRecord& record);

} // namespace acp::core
