#pragma once

#include <memory>
#include <string>

#include "internal/core/sequencer.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/events/event_log.hpp"
#include "internal/token/token.hpp"

namespace acp::core {

/*
  Identities the ledger itself holds tokens under. The tips account only
  ever spends allowances and never holds a balance; the escrow account
  holds exactly the funds of Active bounties.
*/
struct LedgerAccounts {
  std::string tips;
  std::string escrow;

  bool Contains(const std::string& identity) const {
    return identity == tips || identity == escrow;
  }
};

// Shared dependencies of the ledger components.
struct LedgerContext {
  std::shared_ptr<db::Repository>   repository;
  std::shared_ptr<token::Token>     token;
  std::shared_ptr<events::EventLog> events;
  std::shared_ptr<Sequencer>        sequencer;
  LedgerAccounts                    accounts;
};

} // namespace acp::core
