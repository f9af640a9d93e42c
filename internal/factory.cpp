#include "factory.hpp"

#include <stdexcept>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"

#include <spdlog/spdlog.h>

#if ACP_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace acp::factory {

namespace {

// Amount moved by the event; 0 for registrations.
uint64_t EventAmount(const acp::ledger::v1::LedgerEvent& event) {
  using acp::ledger::v1::LedgerEvent;
  switch (event.body_case()) {
    case LedgerEvent::kTipSent:
      return event.tip_sent().amount();
    case LedgerEvent::kBatchTipSent:
      return event.batch_tip_sent().total_amount();
    case LedgerEvent::kBountyCreated:
      return event.bounty_created().amount();
    case LedgerEvent::kBountyClaimed:
      return event.bounty_claimed().amount();
    case LedgerEvent::kBountyCancelled:
      return event.bounty_cancelled().amount_returned();
    case LedgerEvent::kBountyExpired:
      return event.bounty_expired().amount_returned();
    default:
      return 0;
  }
}

void LogCommittedEvents(events::EventLog& log, bool verbose, uint32_t decimals) {
  const auto level = verbose ? spdlog::level::info : spdlog::level::debug;
  log.Subscribe([level, decimals](const acp::ledger::v1::LedgerEvent& event) {
    if (!spdlog::should_log(level)) {
      return;
    }
    observability::Log(level, "ledger event",
                       {observability::UintField("sequence", event.sequence()),
                        observability::StringField("type", acp::ledger::v1::EventType_Name(events::EventLog::TypeOf(event))),
                        observability::AmountField("amount", EventAmount(event), decimals),
                        observability::StringField("body", event.ShortDebugString())});
  });
}

} // namespace

service::ServiceContext Ledger::Services() const {
  service::ServiceContext ctx;
  ctx.tips     = tips;
  ctx.bounties = bounties;
  ctx.registry = registry;
  ctx.token    = token_manager;
  return ctx;
}

std::shared_ptr<db::Repository> BuildRepository(const acp::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if ACP_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("database.sqlite.path must be set");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    sqlite_db->ApplySchema();
    ACP_LOG_INFO("Opened sqlite ledger", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

Ledger BuildLedger(const acp::runtime::config::RuntimeConfig& config, std::shared_ptr<util::Clock> clock) {
  return BuildLedger(config, BuildRepository(config), std::move(clock));
}

Ledger BuildLedger(const acp::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository,
                   std::shared_ptr<util::Clock> clock) {
  const auto& token_config = config.token();
  const auto& accounts     = config.accounts();
  if (accounts.tips().empty() || accounts.escrow().empty() || accounts.tips() == accounts.escrow()) {
    throw std::runtime_error("accounts.tips and accounts.escrow must be set and distinct");
  }

  Ledger ledger;
  ledger.repository = std::move(repository);
  ledger.token      = std::make_shared<token::StoredToken>(
      ledger.repository, token_config.symbol().empty() ? config::kDefaultTokenSymbol : token_config.symbol(),
      token_config.decimals() == 0 ? config::kDefaultTokenDecimals : token_config.decimals());
  ledger.events    = std::make_shared<events::EventLog>(ledger.repository);
  ledger.sequencer = std::make_shared<core::Sequencer>(std::move(clock));

  LogCommittedEvents(*ledger.events, config.logging().log_events(), ledger.token->Decimals());

  core::LedgerContext ctx;
  ctx.repository = ledger.repository;
  ctx.token      = ledger.token;
  ctx.events     = ledger.events;
  ctx.sequencer  = ledger.sequencer;
  ctx.accounts   = core::LedgerAccounts{accounts.tips(), accounts.escrow()};

  ledger.tips     = std::make_shared<core::TipLedger>(ctx);
  ledger.bounties = std::make_shared<core::BountyEscrow>(ctx);
  ledger.registry = std::make_shared<core::Registry>(ctx, ledger.tips, ledger.bounties);

  core::FaucetPolicy faucet;
  faucet.enabled      = token_config.faucet_enabled();
  faucet.max_per_mint = token_config.faucet_max_per_mint() == 0 ? config::kDefaultFaucetMax : token_config.faucet_max_per_mint();
  ledger.token_manager = std::make_shared<core::TokenManager>(ctx, ledger.token, faucet);

  return ledger;
}

} // namespace acp::factory
