#pragma once

#include <map>
#include <mutex>
#include <set>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace acp::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  uint64_t GetBalance(Transaction&, const std::string& identity) override;
  Result SetBalance(Transaction&, const std::string& identity, uint64_t amount) override;
  uint64_t GetAllowance(Transaction&, const std::string& owner, const std::string& spender) override;
  Result SetAllowance(Transaction&, const std::string& owner, const std::string& spender, uint64_t amount) override;

  std::optional<model::TipStatsRecord> GetTipStats(Transaction&, const std::string& identity) override;
  Result UpsertTipStats(Transaction&, const model::TipStatsRecord&) override;
  std::optional<model::BountyStatsRecord> GetBountyStats(Transaction&, const std::string& identity) override;
  Result UpsertBountyStats(Transaction&, const model::BountyStatsRecord&) override;

  Result InsertBounty(Transaction&, model::BountyRecord&) override;
  std::optional<model::BountyRecord> GetBounty(Transaction&, uint64_t id) override;
  Result UpdateBounty(Transaction&, const model::BountyRecord&) override;
  std::vector<uint64_t> GetPosterBounties(Transaction&, const std::string& identity) override;
  Result AppendClaimerBounty(Transaction&, const std::string& claimer, uint64_t bounty_id) override;
  std::vector<uint64_t> GetClaimerBounties(Transaction&, const std::string& identity) override;
  std::vector<model::BountyRecord> ListActiveBounties(Transaction&, uint64_t now, uint64_t offset, uint64_t limit) override;

  std::optional<model::AgentRecord> GetAgent(Transaction&, const std::string& identity) override;
  Result UpsertAgent(Transaction&, const model::AgentRecord&) override;

  Result AppendEvent(Transaction&, model::EventRecord&) override;
  std::vector<model::EventRecord> ReadEvents(Transaction&, uint64_t start_sequence, uint64_t max_entries) override;

private:
  friend class MemoryTransaction;

  using AllowanceKey = std::pair<std::string, std::string>;

  struct State {
    std::unordered_map<std::string, uint64_t> balances;
    std::map<AllowanceKey, uint64_t> allowances;

    std::unordered_map<std::string, model::TipStatsRecord> tip_stats;
    std::unordered_map<std::string, model::BountyStatsRecord> bounty_stats;

    // bounties[id - 1]
    std::vector<model::BountyRecord> bounties;
    std::unordered_map<std::string, std::vector<uint64_t>> poster_bounties;
    std::unordered_map<std::string, std::vector<uint64_t>> claimer_bounties;
    // ids in status Active, including ones whose deadline passed
    std::set<uint64_t> active_bounties;

    std::unordered_map<std::string, model::AgentRecord> agents;

    // events[sequence - 1]
    std::vector<model::EventRecord> events;
  };

  // Writes staged by one transaction. Reads consult it before committed_.
  struct WriteSet {
    std::unordered_map<std::string, uint64_t> balances;
    std::map<AllowanceKey, uint64_t> allowances;

    std::unordered_map<std::string, model::TipStatsRecord> tip_stats;
    std::unordered_map<std::string, model::BountyStatsRecord> bounty_stats;

    // updates of committed bounties and inserts, by id
    std::map<uint64_t, model::BountyRecord> bounties;
    uint64_t inserted_bounties = 0;
    std::unordered_map<std::string, std::vector<uint64_t>> poster_appends;
    std::unordered_map<std::string, std::vector<uint64_t>> claimer_appends;
    std::set<uint64_t> activated;
    std::set<uint64_t> deactivated;

    std::unordered_map<std::string, model::AgentRecord> agents;

    std::vector<model::EventRecord> events;

    bool empty() const;
  };

  std::optional<model::BountyRecord> FindBounty(const WriteSet& staged, uint64_t id) const;

  void Apply(WriteSet&& staged);

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
