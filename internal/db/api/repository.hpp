#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/agent_record.hpp"
#include "internal/db/model/bounty_record.hpp"
#include "internal/db/model/bounty_stats_record.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/tip_stats_record.hpp"

namespace acp::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Bounty ids and event sequences are assigned densely from 1
  - A failed or abandoned transaction leaves no trace

  The DB is the source of truth for:
    token balances and allowances
    tip and bounty counters
    bounties and their histories
    agent identities
    the event log
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Token ledger (absent rows read as zero)
  // ---------------------------------------------------------------------

  virtual uint64_t GetBalance(Transaction&, const std::string& identity) = 0;

  virtual Result SetBalance(Transaction&, const std::string& identity, uint64_t amount) = 0;

  virtual uint64_t GetAllowance(Transaction&, const std::string& owner, const std::string& spender) = 0;

  virtual Result SetAllowance(Transaction&, const std::string& owner, const std::string& spender, uint64_t amount) = 0;

  // ---------------------------------------------------------------------
  // Counters
  // ---------------------------------------------------------------------

  virtual std::optional<model::TipStatsRecord> GetTipStats(Transaction&, const std::string& identity) = 0;

  virtual Result UpsertTipStats(Transaction&, const model::TipStatsRecord&) = 0;

  virtual std::optional<model::BountyStatsRecord> GetBountyStats(Transaction&, const std::string& identity) = 0;

  virtual Result UpsertBountyStats(Transaction&, const model::BountyStatsRecord&) = 0;

  // ---------------------------------------------------------------------
  // Bounties
  // ---------------------------------------------------------------------

  // Assigns the next id to record.id.
  virtual Result InsertBounty(Transaction&, model::BountyRecord&) = 0;

  virtual std::optional<model::BountyRecord> GetBounty(Transaction&, uint64_t id) = 0;

  virtual Result UpdateBounty(Transaction&, const model::BountyRecord&) = 0;

  // Ids posted by identity, ascending.
  virtual std::vector<uint64_t> GetPosterBounties(Transaction&, const std::string& identity) = 0;

  virtual Result AppendClaimerBounty(Transaction&, const std::string& claimer, uint64_t bounty_id) = 0;

  // Ids paid to identity, in claim order.
  virtual std::vector<uint64_t> GetClaimerBounties(Transaction&, const std::string& identity) = 0;

  // Active bounties with deadline == 0 or now <= deadline, ascending id,
  // skipping the first `offset` matches.
  virtual std::vector<model::BountyRecord> ListActiveBounties(Transaction&, uint64_t now, uint64_t offset, uint64_t limit) = 0;

  // ---------------------------------------------------------------------
  // Agents
  // ---------------------------------------------------------------------

  virtual std::optional<model::AgentRecord> GetAgent(Transaction&, const std::string& identity) = 0;

  virtual Result UpsertAgent(Transaction&, const model::AgentRecord&) = 0;

  // ---------------------------------------------------------------------
  // Event log
  // ---------------------------------------------------------------------

  // Assigns the next sequence to record.sequence.
  virtual Result AppendEvent(Transaction&, model::EventRecord&) = 0;

  // Events with sequence >= start_sequence, ascending, at most max_entries.
  virtual std::vector<model::EventRecord> ReadEvents(Transaction&, uint64_t start_sequence, uint64_t max_entries) = 0;
};

} // namespace acp::db
