#include "internal/core/tip_ledger.hpp"

#include "internal/core/guards.hpp"
#include "internal/util/amount.hpp"

namespace acp::core {

TipLedger::TipLedger(LedgerContext ctx) : ctx_(std::move(ctx)) {
}

db::model::TipStatsRecord TipLedger::LoadStats(db::Transaction& tx, const std::string& identity) {
  auto record = ctx_.repository->GetTipStats(tx, identity);
  if (record) {
    return *record;
  }
  db::model::TipStatsRecord fresh;
  fresh.identity = identity;
  return fresh;
}

void TipLedger::Pull(db::Transaction& tx, const std::string& sender, const std::string& recipient, uint64_t amount) {
  if (!ctx_.token->TransferFrom(tx, ctx_.accounts.tips, sender, recipient, amount)) {
    throw util::CustodyTransferFailed("tip transfer from " + sender + " to " + recipient + " failed: insufficient balance or allowance");
  }
}

void TipLedger::CreditRecipient(db::Transaction& tx, const std::string& recipient, uint64_t amount) {
  auto stats           = LoadStats(tx, recipient);
  stats.total_received = util::CheckedAdd(stats.total_received, amount, "totalReceived");
  stats.received_count = util::CheckedAdd(stats.received_count, 1, "receivedCount");
  ThrowIfDbError(ctx_.repository->UpsertTipStats(tx, stats), "upsert tip stats");
}

void TipLedger::DebitSender(db::Transaction& tx, const std::string& sender, uint64_t amount) {
  auto stats       = LoadStats(tx, sender);
  stats.total_sent = util::CheckedAdd(stats.total_sent, amount, "totalSent");
  ThrowIfDbError(ctx_.repository->UpsertTipStats(tx, stats), "upsert tip stats");
}

TipReceipt TipLedger::Tip(const std::string& sender, const std::string& recipient, uint64_t amount, const std::string& post_ref,
                          const std::string& message) {
  RequireIdentity(sender, "tip: sender");
  RequireIdentity(recipient, "tip: recipient");
  RequireNotLedgerAccount(recipient, ctx_.accounts, "tip: recipient");
  if (recipient == sender) {
    throw util::InvalidArgument("tip: cannot tip yourself");
  }
  RequirePositive(amount, "tip: amount");

  return ctx_.sequencer->Run([&](util::UnixSeconds now) {
    auto tx = ctx_.repository->Begin();

    Pull(*tx, sender, recipient, amount);
    CreditRecipient(*tx, recipient, amount);
    DebitSender(*tx, sender, amount);

    acp::ledger::v1::LedgerEvent event;
    event.set_timestamp(now);
    auto* body = event.mutable_tip_sent();
    body->set_from(sender);
    body->set_to(recipient);
    body->set_amount(amount);
    body->set_post_ref(post_ref);
    body->set_message(message);
    auto appended = ctx_.events->Append(*tx, std::move(event));

    tx->Commit();
    ctx_.events->Publish({appended});
    return TipReceipt{amount, appended.sequence()};
  });
}

TipReceipt TipLedger::BatchTip(const std::string& sender, const std::vector<std::string>& recipients,
                               const std::vector<uint64_t>& amounts) {
  RequireIdentity(sender, "batch tip: sender");
  if (recipients.size() != amounts.size()) {
    throw util::InvalidArgument("batch tip: recipients and amounts differ in length");
  }
  if (recipients.empty()) {
    throw util::InvalidArgument("batch tip: no recipients");
  }
  if (recipients.size() > kMaxBatchTipRecipients) {
    throw util::InvalidArgument("batch tip: at most " + std::to_string(kMaxBatchTipRecipients) + " recipients");
  }

  uint64_t total = 0;
  for (size_t i = 0; i < recipients.size(); ++i) {
    RequireIdentity(recipients[i], "batch tip: recipient " + std::to_string(i));
    RequireNotLedgerAccount(recipients[i], ctx_.accounts, "batch tip: recipient " + std::to_string(i));
    if (recipients[i] == sender) {
      throw util::InvalidArgument("batch tip: cannot tip yourself");
    }
    RequirePositive(amounts[i], "batch tip: amount " + std::to_string(i));
    total = util::CheckedAdd(total, amounts[i], "batch tip total");
  }

  return ctx_.sequencer->Run([&](util::UnixSeconds now) {
    auto tx = ctx_.repository->Begin();

    for (size_t i = 0; i < recipients.size(); ++i) {
      Pull(*tx, sender, recipients[i], amounts[i]);
      CreditRecipient(*tx, recipients[i], amounts[i]);
    }
    DebitSender(*tx, sender, total);

    acp::ledger::v1::LedgerEvent event;
    event.set_timestamp(now);
    auto* body = event.mutable_batch_tip_sent();
    body->set_from(sender);
    for (size_t i = 0; i < recipients.size(); ++i) {
      body->add_recipients(recipients[i]);
      body->add_amounts(amounts[i]);
    }
    body->set_total_amount(total);
    auto appended = ctx_.events->Append(*tx, std::move(event));

    tx->Commit();
    ctx_.events->Publish({appended});
    return TipReceipt{total, appended.sequence()};
  });
}

TipStats TipLedger::GetAgentStats(const std::string& identity) {
  return ctx_.sequencer->Run([&](util::UnixSeconds) {
    auto tx     = ctx_.repository->Begin();
    auto record = ctx_.repository->GetTipStats(*tx, identity);

    TipStats stats;
    if (record) {
      stats.set_total_received(record->total_received);
      stats.set_total_sent(record->total_sent);
      stats.set_received_count(record->received_count);
    }
    return stats;
  });
}

} // namespace acp::core
