#include "internal/core/registry.hpp"

#include "internal/core/guards.hpp"

namespace acp::core {

Registry::Registry(LedgerContext ctx, std::shared_ptr<TipLedger> tips, std::shared_ptr<BountyEscrow> bounties)
    : ctx_(std::move(ctx)), tips_(std::move(tips)), bounties_(std::move(bounties)) {
}

uint64_t Registry::RegisterAgent(const std::string& caller, const std::string& name, const std::string& profile) {
  RequireIdentity(caller, "register agent: caller");

  return ctx_.sequencer->Run([&](util::UnixSeconds now) {
    auto tx = ctx_.repository->Begin();

    db::model::AgentRecord record;
    record.identity   = caller;
    record.name       = name;
    record.profile    = profile;
    record.updated_at = now;
    ThrowIfDbError(ctx_.repository->UpsertAgent(*tx, record), "upsert agent");

    acp::ledger::v1::LedgerEvent event;
    event.set_timestamp(now);
    auto* body = event.mutable_agent_registered();
    body->set_agent(caller);
    body->set_name(name);
    body->set_profile(profile);
    auto appended = ctx_.events->Append(*tx, std::move(event));

    tx->Commit();
    ctx_.events->Publish({appended});
    return appended.sequence();
  });
}

AgentProfile Registry::GetFullAgentStats(const std::string& identity) {
  // one pass so the three parts describe the same ledger state
  return ctx_.sequencer->Run([&](util::UnixSeconds) {
    auto tx = ctx_.repository->Begin();

    AgentProfile profile;
    profile.set_identity(identity);
    if (auto record = ctx_.repository->GetAgent(*tx, identity)) {
      profile.set_name(record->name);
      profile.set_profile(record->profile);
    }
    if (auto tips = ctx_.repository->GetTipStats(*tx, identity)) {
      auto* out = profile.mutable_tips();
      out->set_total_received(tips->total_received);
      out->set_total_sent(tips->total_sent);
      out->set_received_count(tips->received_count);
    } else {
      profile.mutable_tips();
    }
    if (auto bounties = ctx_.repository->GetBountyStats(*tx, identity)) {
      auto* out = profile.mutable_bounties();
      out->set_posted_count(bounties->posted_count);
      out->set_claimed_count(bounties->claimed_count);
      out->set_amount_posted(bounties->amount_posted);
      out->set_amount_earned(bounties->amount_earned);
    } else {
      profile.mutable_bounties();
    }
    return profile;
  });
}

uint64_t Registry::GetBalance(const std::string& identity) {
  return ctx_.sequencer->Run([&](util::UnixSeconds) {
    auto tx = ctx_.repository->Begin();
    return ctx_.token->BalanceOf(*tx, identity);
  });
}

uint64_t Registry::AllowanceOf(const std::string& identity, const std::string& spender) {
  return ctx_.sequencer->Run([&](util::UnixSeconds) {
    auto tx = ctx_.repository->Begin();
    return ctx_.token->Allowance(*tx, identity, spender);
  });
}

uint64_t Registry::GetTipsAllowance(const std::string& identity) {
  return AllowanceOf(identity, tips_->Account());
}

uint64_t Registry::GetBountiesAllowance(const std::string& identity) {
  return AllowanceOf(identity, bounties_->Account());
}

events::EventPage Registry::ReadEvents(uint64_t start_sequence, uint64_t max_entries, const events::EventFilter& filter) {
  return ctx_.sequencer->Run([&](util::UnixSeconds) {
    auto tx = ctx_.repository->Begin();
    return ctx_.events->Read(*tx, start_sequence, max_entries, filter);
  });
}

} // namespace acp::core
