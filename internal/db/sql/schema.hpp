#pragma once

#include <array>

namespace acp::db::sql {

/*
  Idempotent schema bootstrap, applied in order at startup.

  AUTOINCREMENT keeps bounty ids and event sequences from being reused;
  rolled back inserts also roll back sqlite_sequence, so both stay dense.
*/
static constexpr std::array<const char*, 11> kSchema = {
    "CREATE TABLE IF NOT EXISTS balances (identity TEXT PRIMARY KEY, amount INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS allowances (owner TEXT NOT NULL, spender TEXT NOT NULL, amount INTEGER NOT NULL, PRIMARY KEY (owner, spender));",
    "CREATE TABLE IF NOT EXISTS tip_stats (identity TEXT PRIMARY KEY, total_received INTEGER NOT NULL, total_sent INTEGER NOT NULL, received_count INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS bounty_stats (identity TEXT PRIMARY KEY, posted_count INTEGER NOT NULL, claimed_count INTEGER NOT NULL, amount_posted INTEGER NOT NULL, amount_earned INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS bounties (id INTEGER PRIMARY KEY AUTOINCREMENT, poster TEXT NOT NULL, amount INTEGER NOT NULL, deadline INTEGER NOT NULL, description TEXT NOT NULL, external_ref TEXT NOT NULL DEFAULT '', status INTEGER NOT NULL, claimed_by TEXT NOT NULL DEFAULT '', created_at INTEGER NOT NULL, claimed_at INTEGER NOT NULL DEFAULT 0);",
    "CREATE INDEX IF NOT EXISTS bounties_poster_idx ON bounties (poster, id);",
    "CREATE INDEX IF NOT EXISTS bounties_active_idx ON bounties (id) WHERE status = 1;",
    "CREATE TABLE IF NOT EXISTS bounty_claims (seq INTEGER PRIMARY KEY AUTOINCREMENT, claimer TEXT NOT NULL, bounty_id INTEGER NOT NULL REFERENCES bounties(id));",
    "CREATE INDEX IF NOT EXISTS bounty_claims_claimer_idx ON bounty_claims (claimer, seq);",
    "CREATE TABLE IF NOT EXISTS agents (identity TEXT PRIMARY KEY, name TEXT NOT NULL, profile TEXT NOT NULL, updated_at INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS events (sequence INTEGER PRIMARY KEY AUTOINCREMENT, type INTEGER NOT NULL, timestamp INTEGER NOT NULL, payload BLOB NOT NULL);",
};

}
