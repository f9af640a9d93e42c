#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "acp/ledger/v1.hpp"
#include "internal/core/ledger_context.hpp"

namespace acp::core {

using acp::ledger::v1::TipStats;

inline constexpr size_t kMaxBatchTipRecipients = 50;

struct TipReceipt {
  uint64_t total_amount   = 0;
  uint64_t event_sequence = 0;
};

/*
  TipLedger

  Immediate, irreversible peer-to-peer transfers pulled through the
  token allowance granted to the tips account. Tips are final.
*/
class TipLedger {
 public:
  explicit TipLedger(LedgerContext ctx);

  TipReceipt Tip(const std::string& sender, const std::string& recipient, uint64_t amount, const std::string& post_ref,
                 const std::string& message);

  // All-or-nothing; duplicate recipients are allowed.
  TipReceipt BatchTip(const std::string& sender, const std::vector<std::string>& recipients, const std::vector<uint64_t>& amounts);

  // Zeros for identities that never tipped or were tipped.
  TipStats GetAgentStats(const std::string& identity);

  const std::string& Account() const {
    return ctx_.accounts.tips;
  }

 private:
  void Pull(db::Transaction& tx, const std::string& sender, const std::string& recipient, uint64_t amount);
  void CreditRecipient(db::Transaction& tx, const std::string& recipient, uint64_t amount);
  void DebitSender(db::Transaction& tx, const std::string& sender, uint64_t amount);

  db::model::TipStatsRecord LoadStats(db::Transaction& tx, const std::string& identity);

  LedgerContext ctx_;
};

} // namespace acp::core
