#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/bounty_escrow.hpp"
#include "internal/core/registry.hpp"
#include "internal/core/sequencer.hpp"
#include "internal/core/tip_ledger.hpp"
#include "internal/core/token_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/events/event_log.hpp"
#include "internal/service/service_context.hpp"
#include "internal/token/stored_token.hpp"
#include "internal/util/time.hpp"

namespace acp::factory {

/*
  Ledger

  Owns every long-lived component of one ledger instance.
*/
struct Ledger {
  std::shared_ptr<db::Repository>     repository;
  std::shared_ptr<token::StoredToken> token;
  std::shared_ptr<events::EventLog>   events;
  std::shared_ptr<core::Sequencer>    sequencer;

  std::shared_ptr<core::TipLedger>    tips;
  std::shared_ptr<core::BountyEscrow> bounties;
  std::shared_ptr<core::Registry>     registry;
  std::shared_ptr<core::TokenManager> token_manager;

  service::ServiceContext Services() const;
};

/*
  BuildRepository

  The ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const acp::runtime::config::RuntimeConfig& config);

/*
  BuildLedger

  Composition root of the ledger core. The config is expected to have
  its defaults applied (ConfigLoader does this).
*/
Ledger BuildLedger(const acp::runtime::config::RuntimeConfig& config, std::shared_ptr<util::Clock> clock);

Ledger BuildLedger(const acp::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository,
                   std::shared_ptr<util::Clock> clock);

} // namespace acp::factory
