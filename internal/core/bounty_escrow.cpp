#include "internal/core/bounty_escrow.hpp"

#include "internal/core/guards.hpp"
#include "internal/model/bounty_state.hpp"
#include "internal/util/amount.hpp"

namespace acp::core {

using namespace acp::ledger::v1;

namespace {

std::string BountyName(uint64_t bounty_id) {
  return "bounty " + std::to_string(bounty_id);
}

} // namespace

Bounty ToProto(const db::model::BountyRecord& record) {
  Bounty bounty;
  bounty.set_id(record.id);
  bounty.set_poster(record.poster);
  bounty.set_amount(record.amount);
  bounty.set_deadline(record.deadline);
  bounty.set_description(record.description);
  bounty.set_external_ref(record.external_ref);
  bounty.set_status(record.status);
  bounty.set_claimed_by(record.claimed_by);
  bounty.set_created_at(record.created_at);
  bounty.set_claimed_at(record.claimed_at);
  return bounty;
}

BountyEscrow::BountyEscrow(LedgerContext ctx) : ctx_(std::move(ctx)) {
}

db::model::BountyStatsRecord BountyEscrow::LoadStats(db::Transaction& tx, const std::string& identity) {
  auto record = ctx_.repository->GetBountyStats(tx, identity);
  if (record) {
    return *record;
  }
  db::model::BountyStatsRecord fresh;
  fresh.identity = identity;
  return fresh;
}

void BountyEscrow::Transition(db::Transaction& tx, db::model::BountyRecord& bounty, BountyStatus to) {
  if (!model::CanTransition(bounty.status, to)) {
    throw util::InvalidState(BountyName(bounty.id) + " cannot move from " + model::StatusName(bounty.status) + " to " +
                             model::StatusName(to));
  }
  bounty.status = to;
  ThrowIfDbError(ctx_.repository->UpdateBounty(tx, bounty), "update " + BountyName(bounty.id));
}

db::model::BountyRecord BountyEscrow::LoadActiveForPoster(db::Transaction& tx, const std::string& caller, uint64_t bounty_id,
                                                          const char* op) {
  auto bounty = ctx_.repository->GetBounty(tx, bounty_id);
  if (!bounty) {
    throw util::NotFound(std::string(op) + ": " + BountyName(bounty_id) + " does not exist");
  }
  if (bounty->poster != caller) {
    throw util::Unauthorized(std::string(op) + ": only the poster of " + BountyName(bounty_id) + " may do this");
  }
  if (bounty->status != BOUNTY_STATUS_ACTIVE) {
    throw util::InvalidState(std::string(op) + ": " + BountyName(bounty_id) + " is " + model::StatusName(bounty->status));
  }
  return *bounty;
}

LedgerEvent BountyEscrow::Refund(db::Transaction& tx, db::model::BountyRecord& bounty, BountyStatus status, util::UnixSeconds now) {
  if (!ctx_.token->Transfer(tx, ctx_.accounts.escrow, bounty.poster, bounty.amount)) {
    throw util::CustodyTransferFailed("refund of " + BountyName(bounty.id) + " failed");
  }
  Transition(tx, bounty, status);

  LedgerEvent event;
  event.set_timestamp(now);
  if (status == BOUNTY_STATUS_CANCELLED) {
    auto* body = event.mutable_bounty_cancelled();
    body->set_bounty_id(bounty.id);
    body->set_poster(bounty.poster);
    body->set_amount_returned(bounty.amount);
  } else {
    auto* body = event.mutable_bounty_expired();
    body->set_bounty_id(bounty.id);
    body->set_poster(bounty.poster);
    body->set_amount_returned(bounty.amount);
  }
  return ctx_.events->Append(tx, std::move(event));
}

uint64_t BountyEscrow::CreateBounty(const std::string& poster, uint64_t amount, uint64_t deadline, const std::string& description,
                                    const std::string& external_ref) {
  RequireIdentity(poster, "create bounty: poster");
  RequireNotLedgerAccount(poster, ctx_.accounts, "create bounty: poster");
  RequirePositive(amount, "create bounty: amount");
  if (description.empty()) {
    throw util::InvalidArgument("create bounty: description must not be empty");
  }

  return ctx_.sequencer->Run([&](util::UnixSeconds now) {
    if (deadline != 0 && deadline <= now) {
      throw util::InvalidArgument("create bounty: deadline must be in the future");
    }

    auto tx = ctx_.repository->Begin();

    if (!ctx_.token->TransferFrom(*tx, ctx_.accounts.escrow, poster, ctx_.accounts.escrow, amount)) {
      throw util::CustodyTransferFailed("create bounty: escrow deposit from " + poster +
                                        " failed: insufficient balance or allowance");
    }

    db::model::BountyRecord bounty;
    bounty.poster       = poster;
    bounty.amount       = amount;
    bounty.deadline     = deadline;
    bounty.description  = description;
    bounty.external_ref = external_ref;
    bounty.status       = BOUNTY_STATUS_ACTIVE;
    bounty.created_at   = now;
    ThrowIfDbError(ctx_.repository->InsertBounty(*tx, bounty), "insert bounty");

    auto stats          = LoadStats(*tx, poster);
    stats.posted_count  = util::CheckedAdd(stats.posted_count, 1, "postedCount");
    stats.amount_posted = util::CheckedAdd(stats.amount_posted, amount, "amountPosted");
    ThrowIfDbError(ctx_.repository->UpsertBountyStats(*tx, stats), "upsert bounty stats");

    LedgerEvent event;
    event.set_timestamp(now);
    auto* body = event.mutable_bounty_created();
    body->set_bounty_id(bounty.id);
    body->set_poster(poster);
    body->set_amount(amount);
    body->set_deadline(deadline);
    body->set_description(description);
    body->set_external_ref(external_ref);
    auto appended = ctx_.events->Append(*tx, std::move(event));

    tx->Commit();
    ctx_.events->Publish({appended});
    return bounty.id;
  });
}

Bounty BountyEscrow::ApproveClaim(const std::string& caller, uint64_t bounty_id, const std::string& claimer, const std::string& proof) {
  return ctx_.sequencer->Run([&](util::UnixSeconds now) {
    auto tx     = ctx_.repository->Begin();
    auto bounty = LoadActiveForPoster(*tx, caller, bounty_id, "approve claim");

    RequireIdentity(claimer, "approve claim: claimer");
    RequireNotLedgerAccount(claimer, ctx_.accounts, "approve claim: claimer");
    if (claimer == caller) {
      throw util::Unauthorized("approve claim: the poster cannot claim their own bounty");
    }

    // lazy expiry: a passed deadline settles the bounty as Expired instead of paying
    if (bounty.deadline != 0 && now > bounty.deadline) {
      auto expired = Refund(*tx, bounty, BOUNTY_STATUS_EXPIRED, now);
      tx->Commit();
      ctx_.events->Publish({expired});
      return ToProto(bounty);
    }

    if (!ctx_.token->Transfer(*tx, ctx_.accounts.escrow, claimer, bounty.amount)) {
      throw util::CustodyTransferFailed("approve claim: payout of " + BountyName(bounty_id) + " failed");
    }

    bounty.claimed_by = claimer;
    bounty.claimed_at = now;
    Transition(*tx, bounty, BOUNTY_STATUS_CLAIMED);
    ThrowIfDbError(ctx_.repository->AppendClaimerBounty(*tx, claimer, bounty_id), "append claimer bounty");

    auto stats          = LoadStats(*tx, claimer);
    stats.claimed_count = util::CheckedAdd(stats.claimed_count, 1, "claimedCount");
    stats.amount_earned = util::CheckedAdd(stats.amount_earned, bounty.amount, "amountEarned");
    ThrowIfDbError(ctx_.repository->UpsertBountyStats(*tx, stats), "upsert bounty stats");

    LedgerEvent event;
    event.set_timestamp(now);
    auto* body = event.mutable_bounty_claimed();
    body->set_bounty_id(bounty_id);
    body->set_poster(bounty.poster);
    body->set_claimer(claimer);
    body->set_amount(bounty.amount);
    body->set_proof(proof);
    auto appended = ctx_.events->Append(*tx, std::move(event));

    tx->Commit();
    ctx_.events->Publish({appended});
    return ToProto(bounty);
  });
}

Bounty BountyEscrow::CancelBounty(const std::string& caller, uint64_t bounty_id) {
  return ctx_.sequencer->Run([&](util::UnixSeconds now) {
    auto tx     = ctx_.repository->Begin();
    auto bounty = LoadActiveForPoster(*tx, caller, bounty_id, "cancel bounty");

    auto cancelled = Refund(*tx, bounty, BOUNTY_STATUS_CANCELLED, now);
    tx->Commit();
    ctx_.events->Publish({cancelled});
    return ToProto(bounty);
  });
}

Bounty BountyEscrow::ClaimExpired(const std::string& caller, uint64_t bounty_id) {
  return ctx_.sequencer->Run([&](util::UnixSeconds now) {
    auto tx     = ctx_.repository->Begin();
    auto bounty = LoadActiveForPoster(*tx, caller, bounty_id, "claim expired");

    if (bounty.deadline == 0) {
      throw util::PreconditionFailed("claim expired: " + BountyName(bounty_id) + " has no deadline");
    }
    if (now <= bounty.deadline) {
      throw util::PreconditionFailed("claim expired: deadline of " + BountyName(bounty_id) + " has not passed");
    }

    auto expired = Refund(*tx, bounty, BOUNTY_STATUS_EXPIRED, now);
    tx->Commit();
    ctx_.events->Publish({expired});
    return ToProto(bounty);
  });
}

Bounty BountyEscrow::GetBounty(uint64_t bounty_id) {
  return ctx_.sequencer->Run([&](util::UnixSeconds) {
    auto tx     = ctx_.repository->Begin();
    auto bounty = ctx_.repository->GetBounty(*tx, bounty_id);
    if (!bounty) {
      throw util::NotFound(BountyName(bounty_id) + " does not exist");
    }
    return ToProto(*bounty);
  });
}

std::vector<uint64_t> BountyEscrow::GetPosterBounties(const std::string& identity) {
  return ctx_.sequencer->Run([&](util::UnixSeconds) {
    auto tx = ctx_.repository->Begin();
    return ctx_.repository->GetPosterBounties(*tx, identity);
  });
}

std::vector<uint64_t> BountyEscrow::GetClaimerBounties(const std::string& identity) {
  return ctx_.sequencer->Run([&](util::UnixSeconds) {
    auto tx = ctx_.repository->Begin();
    return ctx_.repository->GetClaimerBounties(*tx, identity);
  });
}

std::vector<Bounty> BountyEscrow::GetActiveBounties(uint64_t offset, uint64_t limit) {
  return ctx_.sequencer->Run([&](util::UnixSeconds now) {
    auto tx      = ctx_.repository->Begin();
    auto records = ctx_.repository->ListActiveBounties(*tx, now, offset, limit);

    std::vector<Bounty> out;
    out.reserve(records.size());
    for (const auto& record : records) {
      out.push_back(ToProto(record));
    }
    return out;
  });
}

BountyStats BountyEscrow::GetAgentStats(const std::string& identity) {
  return ctx_.sequencer->Run([&](util::UnixSeconds) {
    auto tx     = ctx_.repository->Begin();
    auto record = ctx_.repository->GetBountyStats(*tx, identity);

    BountyStats stats;
    if (record) {
      stats.set_posted_count(record->posted_count);
      stats.set_claimed_count(record->claimed_count);
      stats.set_amount_posted(record->amount_posted);
      stats.set_amount_earned(record->amount_earned);
    }
    return stats;
  });
}

} // namespace acp::core
