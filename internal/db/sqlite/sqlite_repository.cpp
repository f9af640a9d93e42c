#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <cstdint>
#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace acp::db::sqlite {

using acp::db::ErrorCode;
using acp::db::Result;

namespace {

struct Finalize {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, Finalize>;

Statement Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    return Statement{};
  }
  return Statement{st};
}

// Reads have no Result to carry a failure, so they throw.
Statement PrepareOrThrow(sqlite3* db, const char* sql) {
  auto st = Prepare(db, sql);
  if (!st) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return st;
}

bool StepRow(sqlite3* db, sqlite3_stmt* st) {
  const int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? std::string(reinterpret_cast<const char*>(t), static_cast<size_t>(sqlite3_column_bytes(st, col))) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* b = sqlite3_column_blob(st, col);
  return b ? std::string(static_cast<const char*>(b), static_cast<size_t>(sqlite3_column_bytes(st, col))) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

model::BountyRecord ReadBounty(sqlite3_stmt* st) {
  model::BountyRecord r;
  r.id           = ColU64(st, 0);
  r.poster       = ColText(st, 1);
  r.amount       = ColU64(st, 2);
  r.deadline     = ColU64(st, 3);
  r.description  = ColText(st, 4);
  r.external_ref = ColText(st, 5);
  r.status       = static_cast<acp::ledger::v1::BountyStatus>(ColI32(st, 6));
  r.claimed_by   = ColText(st, 7);
  r.created_at   = ColU64(st, 8);
  r.claimed_at   = ColU64(st, 9);
  return r;
}

std::vector<uint64_t> ReadIds(sqlite3* db, sqlite3_stmt* st) {
  std::vector<uint64_t> ids;
  while (StepRow(db, st)) {
    ids.push_back(ColU64(st, 0));
  }
  return ids;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Token ledger
// ------------------------------------------------------------------

uint64_t SqliteRepository::GetBalance(Transaction& t, const std::string& identity) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db, sql::SELECT_BALANCE);
    BindText(st.get(), 1, identity);
    return StepRow(db, st.get()) ? ColU64(st.get(), 0) : 0;
}

Result SqliteRepository::SetBalance(Transaction& t, const std::string& identity, uint64_t amount) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::UPSERT_BALANCE);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, identity);
    BindU64(st.get(), 2, amount);
    return Translate(db, sqlite3_step(st.get()));
}

uint64_t SqliteRepository::GetAllowance(Transaction& t, const std::string& owner, const std::string& spender) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db, sql::SELECT_ALLOWANCE);
    BindText(st.get(), 1, owner);
    BindText(st.get(), 2, spender);
    return StepRow(db, st.get()) ? ColU64(st.get(), 0) : 0;
}

Result SqliteRepository::SetAllowance(Transaction& t, const std::string& owner, const std::string& spender, uint64_t amount) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::UPSERT_ALLOWANCE);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, owner);
    BindText(st.get(), 2, spender);
    BindU64(st.get(), 3, amount);
    return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Counters
// ------------------------------------------------------------------

std::optional<model::TipStatsRecord> SqliteRepository::GetTipStats(Transaction& t, const std::string& identity) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db, sql::SELECT_TIP_STATS);
    BindText(st.get(), 1, identity);
    if (!StepRow(db, st.get())) return std::nullopt;

    model::TipStatsRecord r;
    r.identity       = ColText(st.get(), 0);
    r.total_received = ColU64(st.get(), 1);
    r.total_sent     = ColU64(st.get(), 2);
    r.received_count = ColU64(st.get(), 3);
    return r;
}

Result SqliteRepository::UpsertTipStats(Transaction& t, const model::TipStatsRecord& r) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::UPSERT_TIP_STATS);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.identity);
    BindU64(st.get(), 2, r.total_received);
    BindU64(st.get(), 3, r.total_sent);
    BindU64(st.get(), 4, r.received_count);
    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::BountyStatsRecord> SqliteRepository::GetBountyStats(Transaction& t, const std::string& identity) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db, sql::SELECT_BOUNTY_STATS);
    BindText(st.get(), 1, identity);
    if (!StepRow(db, st.get())) return std::nullopt;

    model::BountyStatsRecord r;
    r.identity      = ColText(st.get(), 0);
    r.posted_count  = ColU64(st.get(), 1);
    r.claimed_count = ColU64(st.get(), 2);
    r.amount_posted = ColU64(st.get(), 3);
    r.amount_earned = ColU64(st.get(), 4);
    return r;
}

Result SqliteRepository::UpsertBountyStats(Transaction& t, const model::BountyStatsRecord& r) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::UPSERT_BOUNTY_STATS);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.identity);
    BindU64(st.get(), 2, r.posted_count);
    BindU64(st.get(), 3, r.claimed_count);
    BindU64(st.get(), 4, r.amount_posted);
    BindU64(st.get(), 5, r.amount_earned);
    return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Bounties
// ------------------------------------------------------------------

Result SqliteRepository::InsertBounty(Transaction& t, model::BountyRecord& r) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::INSERT_BOUNTY);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.poster);
    BindU64(st.get(), 2, r.amount);
    BindU64(st.get(), 3, r.deadline);
    BindText(st.get(), 4, r.description);
    BindText(st.get(), 5, r.external_ref);
    BindI32(st.get(), 6, static_cast<int>(r.status));
    BindText(st.get(), 7, r.claimed_by);
    BindU64(st.get(), 8, r.created_at);
    BindU64(st.get(), 9, r.claimed_at);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result) {
        r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    }
    return result;
}

std::optional<model::BountyRecord> SqliteRepository::GetBounty(Transaction& t, uint64_t id) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db, sql::SELECT_BOUNTY);
    BindU64(st.get(), 1, id);
    if (!StepRow(db, st.get())) return std::nullopt;
    return ReadBounty(st.get());
}

Result SqliteRepository::UpdateBounty(Transaction& t, const model::BountyRecord& r) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::UPDATE_BOUNTY);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(st.get(), 1, static_cast<int>(r.status));
    BindText(st.get(), 2, r.claimed_by);
    BindU64(st.get(), 3, r.claimed_at);
    BindU64(st.get(), 4, r.id);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result && sqlite3_changes(db) == 0) {
        return Result::Err(ErrorCode::NotFound, "bounty " + std::to_string(r.id));
    }
    return result;
}

std::vector<uint64_t> SqliteRepository::GetPosterBounties(Transaction& t, const std::string& identity) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db, sql::SELECT_POSTER_BOUNTIES);
    BindText(st.get(), 1, identity);
    return ReadIds(db, st.get());
}

Result SqliteRepository::AppendClaimerBounty(Transaction& t, const std::string& claimer, uint64_t bounty_id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::INSERT_BOUNTY_CLAIM);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, claimer);
    BindU64(st.get(), 2, bounty_id);
    return Translate(db, sqlite3_step(st.get()));
}

std::vector<uint64_t> SqliteRepository::GetClaimerBounties(Transaction& t, const std::string& identity) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db, sql::SELECT_CLAIMER_BOUNTIES);
    BindText(st.get(), 1, identity);
    return ReadIds(db, st.get());
}

std::vector<model::BountyRecord> SqliteRepository::ListActiveBounties(Transaction& t, uint64_t now, uint64_t offset, uint64_t limit) {
    std::vector<model::BountyRecord> out;
    if (limit == 0) return out;

    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db, sql::SELECT_ACTIVE_BOUNTIES);
    BindU64(st.get(), 1, now);
    // sqlite LIMIT is signed; clamp so huge limits do not wrap negative
    BindU64(st.get(), 2, std::min<uint64_t>(limit, static_cast<uint64_t>(INT64_MAX)));
    BindU64(st.get(), 3, std::min<uint64_t>(offset, static_cast<uint64_t>(INT64_MAX)));

    while (StepRow(db, st.get())) {
        out.push_back(ReadBounty(st.get()));
    }
    return out;
}

// ------------------------------------------------------------------
// Agents
// ------------------------------------------------------------------

std::optional<model::AgentRecord> SqliteRepository::GetAgent(Transaction& t, const std::string& identity) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db, sql::SELECT_AGENT);
    BindText(st.get(), 1, identity);
    if (!StepRow(db, st.get())) return std::nullopt;

    model::AgentRecord r;
    r.identity   = ColText(st.get(), 0);
    r.name       = ColText(st.get(), 1);
    r.profile    = ColText(st.get(), 2);
    r.updated_at = ColU64(st.get(), 3);
    return r;
}

Result SqliteRepository::UpsertAgent(Transaction& t, const model::AgentRecord& r) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::UPSERT_AGENT);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.identity);
    BindText(st.get(), 2, r.name);
    BindText(st.get(), 3, r.profile);
    BindU64(st.get(), 4, r.updated_at);
    return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Event log
// ------------------------------------------------------------------

Result SqliteRepository::AppendEvent(Transaction& t, model::EventRecord& r) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::INSERT_EVENT);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(st.get(), 1, static_cast<int>(r.type));
    BindU64(st.get(), 2, r.timestamp);
    BindBlob(st.get(), 3, r.payload);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result) {
        r.sequence = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    }
    return result;
}

std::vector<model::EventRecord> SqliteRepository::ReadEvents(Transaction& t, uint64_t start_sequence, uint64_t max_entries) {
    std::vector<model::EventRecord> out;
    if (max_entries == 0) return out;

    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db, sql::SELECT_EVENTS);
    BindU64(st.get(), 1, start_sequence);
    BindU64(st.get(), 2, std::min<uint64_t>(max_entries, static_cast<uint64_t>(INT64_MAX)));

    while (StepRow(db, st.get())) {
        model::EventRecord r;
        r.sequence  = ColU64(st.get(), 0);
        r.type      = static_cast<acp::ledger::v1::EventType>(ColI32(st.get(), 1));
        r.timestamp = ColU64(st.get(), 2);
        r.payload   = ColBlob(st.get(), 3);
        out.push_back(std::move(r));
    }
    return out;
}

} // namespace acp::db::sqlite
