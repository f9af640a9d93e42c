#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace acp::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
