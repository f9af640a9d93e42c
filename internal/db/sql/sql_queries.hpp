#pragma once

namespace acp::db::sql {

/*
  Canonical SQL used by the SQLite backend.

  Bounty status 1 is BOUNTY_STATUS_ACTIVE; the partial index on it
  only applies to the literal.

  Amounts, deadlines and timestamps are stored as INTEGER and bound as
  int64; the repository casts them back to uint64.
*/

// token ledger

static constexpr const char* SELECT_BALANCE =
    "SELECT amount FROM balances WHERE identity=?;";

static constexpr const char* UPSERT_BALANCE =
    "INSERT INTO balances(identity,amount) VALUES(?,?)"
    " ON CONFLICT(identity) DO UPDATE SET amount=excluded.amount;";

static constexpr const char* SELECT_ALLOWANCE =
    "SELECT amount FROM allowances WHERE owner=? AND spender=?;";

static constexpr const char* UPSERT_ALLOWANCE =
    "INSERT INTO allowances(owner,spender,amount) VALUES(?,?,?)"
    " ON CONFLICT(owner,spender) DO UPDATE SET amount=excluded.amount;";

// counters

static constexpr const char* SELECT_TIP_STATS =
    "SELECT identity,total_received,total_sent,received_count"
    " FROM tip_stats WHERE identity=?;";

static constexpr const char* UPSERT_TIP_STATS =
    "INSERT INTO tip_stats(identity,total_received,total_sent,received_count)"
    " VALUES(?,?,?,?)"
    " ON CONFLICT(identity) DO UPDATE SET"
    " total_received=excluded.total_received,"
    " total_sent=excluded.total_sent,"
    " received_count=excluded.received_count;";

static constexpr const char* SELECT_BOUNTY_STATS =
    "SELECT identity,posted_count,claimed_count,amount_posted,amount_earned"
    " FROM bounty_stats WHERE identity=?;";

static constexpr const char* UPSERT_BOUNTY_STATS =
    "INSERT INTO bounty_stats(identity,posted_count,claimed_count,amount_posted,amount_earned)"
    " VALUES(?,?,?,?,?)"
    " ON CONFLICT(identity) DO UPDATE SET"
    " posted_count=excluded.posted_count,"
    " claimed_count=excluded.claimed_count,"
    " amount_posted=excluded.amount_posted,"
    " amount_earned=excluded.amount_earned;";

// bounties

static constexpr const char* INSERT_BOUNTY =
    "INSERT INTO bounties(poster,amount,deadline,description,external_ref,status,claimed_by,created_at,claimed_at)"
    " VALUES(?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_BOUNTY =
    "SELECT id,poster,amount,deadline,description,external_ref,status,claimed_by,created_at,claimed_at"
    " FROM bounties WHERE id=?;";

static constexpr const char* UPDATE_BOUNTY =
    "UPDATE bounties SET status=?,claimed_by=?,claimed_at=? WHERE id=?;";

static constexpr const char* SELECT_POSTER_BOUNTIES =
    "SELECT id FROM bounties WHERE poster=? ORDER BY id;";

static constexpr const char* INSERT_BOUNTY_CLAIM =
    "INSERT INTO bounty_claims(claimer,bounty_id) VALUES(?,?);";

static constexpr const char* SELECT_CLAIMER_BOUNTIES =
    "SELECT bounty_id FROM bounty_claims WHERE claimer=? ORDER BY seq;";

// Deadlines are uint64 stored bit-for-bit in signed columns, so values
// above INT64_MAX read back negative. The comparison below orders them
// as unsigned: a negative deadline outranks any non-negative now.
static constexpr const char* SELECT_ACTIVE_BOUNTIES =
    "SELECT id,poster,amount,deadline,description,external_ref,status,claimed_by,created_at,claimed_at"
    " FROM bounties WHERE status=1 AND (deadline=0"
    " OR (deadline<0) > (?1<0)"
    " OR ((deadline<0) = (?1<0) AND deadline>=?1))"
    " ORDER BY id LIMIT ?2 OFFSET ?3;";

// agents

static constexpr const char* SELECT_AGENT =
    "SELECT identity,name,profile,updated_at FROM agents WHERE identity=?;";

static constexpr const char* UPSERT_AGENT =
    "INSERT INTO agents(identity,name,profile,updated_at) VALUES(?,?,?,?)"
    " ON CONFLICT(identity) DO UPDATE SET"
    " name=excluded.name,"
    " profile=excluded.profile,"
    " updated_at=excluded.updated_at;";

// event log

static constexpr const char* INSERT_EVENT =
    "INSERT INTO events(type,timestamp,payload) VALUES(?,?,?);";

static constexpr const char* SELECT_EVENTS =
    "SELECT sequence,type,timestamp,payload FROM events"
    " WHERE sequence>=? ORDER BY sequence LIMIT ?;";

}
