#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/events/event_log.hpp"
#include "support/ledger_fixture.hpp"

#if ACP_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using acp::db::Repository;
using acp::db::memory::MemoryRepository;
using acp::db::model::AgentRecord;
using acp::db::model::BountyRecord;
using acp::db::model::BountyStatsRecord;
using acp::db::model::EventRecord;
using acp::db::model::TipStatsRecord;
using acp::ledger::v1::BOUNTY_STATUS_ACTIVE;
using acp::ledger::v1::BOUNTY_STATUS_CANCELLED;
using acp::ledger::v1::BOUNTY_STATUS_CLAIMED;

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

uint64_t NowMs() {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
}

BountyRecord MakeBounty(const std::string& poster, uint64_t amount, uint64_t deadline) {
  BountyRecord r;
  r.poster       = poster;
  r.amount       = amount;
  r.deadline     = deadline;
  r.description  = "index the archive";
  r.external_ref = "ref-" + poster;
  r.status       = BOUNTY_STATUS_ACTIVE;
  r.created_at   = acp::testing::kGenesis;
  return r;
}

EventRecord MakeEvent(acp::ledger::v1::EventType type, uint64_t timestamp, std::string payload) {
  EventRecord e;
  e.type      = type;
  e.timestamp = timestamp;
  e.payload   = std::move(payload);
  return e;
}

void VerifyTokenLedger(Repository& repo, const std::string& prefix) {
  const std::string alice = prefix + "-alice";
  const std::string bob   = prefix + "-bob";

  {
    auto tx = repo.Begin();
    assert(repo.GetBalance(*tx, alice) == 0);
    assert(repo.GetAllowance(*tx, alice, "acp:tips") == 0);

    assert(repo.SetBalance(*tx, alice, 1'000'000));
    assert(repo.SetBalance(*tx, bob, UINT64_MAX));
    assert(repo.SetAllowance(*tx, alice, "acp:tips", 250));
    assert(repo.SetAllowance(*tx, alice, "acp:bounties", 750));
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(repo.GetBalance(*tx, alice) == 1'000'000);
  assert(repo.GetBalance(*tx, bob) == UINT64_MAX);
  assert(repo.GetAllowance(*tx, alice, "acp:tips") == 250);
  assert(repo.GetAllowance(*tx, alice, "acp:bounties") == 750);
  assert(repo.GetAllowance(*tx, bob, "acp:tips") == 0);

  assert(repo.SetAllowance(*tx, alice, "acp:tips", 0));
  assert(repo.GetAllowance(*tx, alice, "acp:tips") == 0);
  tx->Commit();
}

void VerifyCounters(Repository& repo, const std::string& prefix) {
  const std::string agent = prefix + "-agent";
  {
    auto tx = repo.Begin();
    assert(!repo.GetTipStats(*tx, agent).has_value());
    assert(!repo.GetBountyStats(*tx, agent).has_value());

    TipStatsRecord tips{agent, 40, 15, 3};
    BountyStatsRecord bounties{agent, 2, 1, 900, 300};
    assert(repo.UpsertTipStats(*tx, tips));
    assert(repo.UpsertBountyStats(*tx, bounties));
    tx->Commit();
  }
  {
    auto tx = repo.Begin();
    TipStatsRecord tips{agent, 50, 15, 4};
    assert(repo.UpsertTipStats(*tx, tips));
    tx->Commit();
  }

  auto tx = repo.Begin();
  auto tips = repo.GetTipStats(*tx, agent);
  assert(tips.has_value());
  assert(tips->total_received == 50 && tips->total_sent == 15 && tips->received_count == 4);

  auto bounties = repo.GetBountyStats(*tx, agent);
  assert(bounties.has_value());
  assert(bounties->posted_count == 2 && bounties->claimed_count == 1);
  assert(bounties->amount_posted == 900 && bounties->amount_earned == 300);
}

void VerifyBountyLifecycle(Repository& repo, const std::string& prefix) {
  const std::string poster  = prefix + "-poster";
  const std::string claimer = prefix + "-claimer";
  const uint64_t    now     = acp::testing::kGenesis;

  uint64_t open_id = 0, expiring_id = 0, settled_id = 0;
  {
    auto tx = repo.Begin();
    BountyRecord open     = MakeBounty(poster, 100, 0);
    BountyRecord expiring = MakeBounty(poster, 200, now + 10);
    BountyRecord settled  = MakeBounty(poster, 300, now + 3600);
    assert(repo.InsertBounty(*tx, open));
    assert(repo.InsertBounty(*tx, expiring));
    assert(repo.InsertBounty(*tx, settled));
    assert(expiring.id == open.id + 1 && settled.id == expiring.id + 1);
    open_id     = open.id;
    expiring_id = expiring.id;
    settled_id  = settled.id;
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    auto bounty = repo.GetBounty(*tx, settled_id);
    assert(bounty.has_value());
    assert(bounty->poster == poster && bounty->amount == 300);
    assert(bounty->description == "index the archive");
    assert(bounty->external_ref == "ref-" + poster);
    assert(bounty->created_at == now);

    bounty->status     = BOUNTY_STATUS_CLAIMED;
    bounty->claimed_by = claimer;
    bounty->claimed_at = now + 5;
    assert(repo.UpdateBounty(*tx, *bounty));
    assert(repo.AppendClaimerBounty(*tx, claimer, settled_id));
    tx->Commit();
  }

  auto tx = repo.Begin();
  auto settled = repo.GetBounty(*tx, settled_id);
  assert(settled->status == BOUNTY_STATUS_CLAIMED);
  assert(settled->claimed_by == claimer);
  assert(settled->claimed_at == now + 5);

  auto posted = repo.GetPosterBounties(*tx, poster);
  assert((posted == std::vector<uint64_t>{open_id, expiring_id, settled_id}));
  assert((repo.GetClaimerBounties(*tx, claimer) == std::vector<uint64_t>{settled_id}));
  assert(repo.GetClaimerBounties(*tx, poster).empty());

  // Only bounties of this suite; ids from earlier suites on the same
  // backend come first in ascending order.
  auto active_of = [&](uint64_t at, uint64_t offset, uint64_t limit) {
    std::vector<uint64_t> ids;
    for (const auto& b : repo.ListActiveBounties(*tx, at, offset, limit)) {
      if (b.poster == poster) ids.push_back(b.id);
    }
    return ids;
  };

  assert((active_of(now, 0, 100) == std::vector<uint64_t>{open_id, expiring_id}));
  // deadline inclusive
  assert((active_of(now + 10, 0, 100) == std::vector<uint64_t>{open_id, expiring_id}));
  assert((active_of(now + 11, 0, 100) == std::vector<uint64_t>{open_id}));

  auto all_active = repo.ListActiveBounties(*tx, now, 0, 1000);
  auto second     = repo.ListActiveBounties(*tx, now, 1, 1);
  assert(all_active.size() >= 2);
  assert(second.size() == 1 && second[0].id == all_active[1].id);

  BountyRecord missing = MakeBounty(poster, 1, 0);
  missing.id           = settled_id + 1000;
  missing.status       = BOUNTY_STATUS_CANCELLED;
  assert(repo.UpdateBounty(*tx, missing).code == acp::db::ErrorCode::NotFound);
}

void VerifyFarDeadlines(Repository& repo, const std::string& prefix) {
  const std::string poster = prefix + "-poster";
  const uint64_t    now    = acp::testing::kGenesis;
  const uint64_t    past_signed_range = static_cast<uint64_t>(INT64_MAX) + 1;

  uint64_t near_id = 0, wide_id = 0, max_id = 0;
  {
    auto tx = repo.Begin();
    BountyRecord near = MakeBounty(poster, 10, now + 10);
    BountyRecord wide = MakeBounty(poster, 20, past_signed_range);
    BountyRecord max  = MakeBounty(poster, 30, UINT64_MAX);
    assert(repo.InsertBounty(*tx, near));
    assert(repo.InsertBounty(*tx, wide));
    assert(repo.InsertBounty(*tx, max));
    near_id = near.id;
    wide_id = wide.id;
    max_id  = max.id;
    tx->Commit();
  }

  auto tx        = repo.Begin();
  auto active_of = [&](uint64_t at) {
    std::vector<uint64_t> ids;
    for (const auto& b : repo.ListActiveBounties(*tx, at, 0, 1000)) {
      if (b.poster == poster) ids.push_back(b.id);
    }
    return ids;
  };

  assert(repo.GetBounty(*tx, max_id)->deadline == UINT64_MAX);
  assert(repo.GetBounty(*tx, wide_id)->deadline == past_signed_range);

  assert((active_of(now) == std::vector<uint64_t>{near_id, wide_id, max_id}));
  assert((active_of(static_cast<uint64_t>(INT64_MAX)) == std::vector<uint64_t>{wide_id, max_id}));
  assert((active_of(past_signed_range) == std::vector<uint64_t>{wide_id, max_id}));
  assert((active_of(past_signed_range + 1) == std::vector<uint64_t>{max_id}));
  assert((active_of(UINT64_MAX) == std::vector<uint64_t>{max_id}));
}

void VerifyAgents(Repository& repo, const std::string& prefix) {
  const std::string identity = prefix + "-registered";
  {
    auto tx = repo.Begin();
    assert(!repo.GetAgent(*tx, identity).has_value());
    assert(repo.UpsertAgent(*tx, AgentRecord{identity, "scout", "ipfs://one", 10}));
    tx->Commit();
  }
  {
    auto tx = repo.Begin();
    assert(repo.UpsertAgent(*tx, AgentRecord{identity, "scout-2", "ipfs://two", 20}));
    tx->Commit();
  }

  auto tx    = repo.Begin();
  auto agent = repo.GetAgent(*tx, identity);
  assert(agent.has_value());
  assert(agent->name == "scout-2");
  assert(agent->profile == "ipfs://two");
  assert(agent->updated_at == 20);
}

void VerifyEventLog(Repository& repo, const std::string& prefix) {
  uint64_t first = 0;
  {
    auto tx = repo.Begin();
    EventRecord a = MakeEvent(acp::ledger::v1::EVENT_TYPE_TIP_SENT, 100, prefix + "-a");
    EventRecord b = MakeEvent(acp::ledger::v1::EVENT_TYPE_BOUNTY_CREATED, 101, prefix + "-b");
    EventRecord c = MakeEvent(acp::ledger::v1::EVENT_TYPE_AGENT_REGISTERED, 102, prefix + "-c");
    assert(repo.AppendEvent(*tx, a));
    assert(repo.AppendEvent(*tx, b));
    assert(repo.AppendEvent(*tx, c));
    assert(b.sequence == a.sequence + 1 && c.sequence == b.sequence + 1);
    first = a.sequence;
    tx->Commit();
  }

  auto tx     = repo.Begin();
  auto events = repo.ReadEvents(*tx, first, 10);
  assert(events.size() == 3);
  assert(events[0].sequence == first);
  assert(events[0].type == acp::ledger::v1::EVENT_TYPE_TIP_SENT);
  assert(events[0].timestamp == 100);
  assert(events[0].payload == prefix + "-a");
  assert(events[2].payload == prefix + "-c");

  auto page = repo.ReadEvents(*tx, first + 1, 1);
  assert(page.size() == 1 && page[0].payload == prefix + "-b");
  assert(repo.ReadEvents(*tx, first + 3, 10).empty());
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  const std::string identity = prefix + "-ghost";

  uint64_t next_bounty = 0;
  uint64_t next_event  = 0;
  {
    auto tx = repo.Begin();
    BountyRecord b = MakeBounty(identity, 5, 0);
    EventRecord  e = MakeEvent(acp::ledger::v1::EVENT_TYPE_TIP_SENT, 1, "rolled back");
    repo.SetBalance(*tx, identity, 99);
    repo.InsertBounty(*tx, b);
    repo.AppendEvent(*tx, e);
    repo.UpsertAgent(*tx, AgentRecord{identity, "ghost", "none", 1});
    next_bounty = b.id;
    next_event  = e.sequence;
    tx->Rollback();
  }
  {
    // abandoned without commit
    auto tx = repo.Begin();
    repo.SetAllowance(*tx, identity, "acp:tips", 7);
  }

  auto tx = repo.Begin();
  assert(repo.GetBalance(*tx, identity) == 0);
  assert(repo.GetAllowance(*tx, identity, "acp:tips") == 0);
  assert(!repo.GetBounty(*tx, next_bounty).has_value());
  assert(repo.GetPosterBounties(*tx, identity).empty());
  assert(!repo.GetAgent(*tx, identity).has_value());
  assert(repo.ReadEvents(*tx, next_event, 10).empty());

  // Ids of the rolled back writes are handed out again.
  BountyRecord b = MakeBounty(identity, 5, 0);
  EventRecord  e = MakeEvent(acp::ledger::v1::EVENT_TYPE_TIP_SENT, 1, "kept");
  repo.InsertBounty(*tx, b);
  repo.AppendEvent(*tx, e);
  assert(b.id == next_bounty);
  assert(e.sequence == next_event);
  tx->Commit();
}

void VerifyLedgerScenario(const std::shared_ptr<Repository>& repo, const std::string& prefix) {
  acp::testing::LedgerFixture fx(repo);
  const std::string poster  = prefix + "-poster-agent";
  const std::string worker  = prefix + "-worker-agent";
  const std::string sponsor = prefix + "-sponsor-agent";

  fx.Prepare(poster, 1'000'000);
  fx.Prepare(sponsor, 500'000);
  const uint64_t escrow_before = fx.EscrowBalance();

  fx.ledger.tips->Tip(sponsor, worker, 125'000, "post-1", "thanks");
  uint64_t id = fx.ledger.bounties->CreateBounty(poster, 400'000, acp::testing::kGenesis + 60, "label data", "");
  assert(fx.EscrowBalance() == escrow_before + 400'000);

  auto settled = fx.ledger.bounties->ApproveClaim(poster, id, worker, "proof");
  assert(settled.status() == BOUNTY_STATUS_CLAIMED);
  assert(fx.EscrowBalance() == escrow_before);

  assert(fx.Balance(poster) == 600'000);
  assert(fx.Balance(worker) == 525'000);
  assert(fx.Balance(sponsor) == 375'000);

  auto profile = fx.ledger.registry->GetFullAgentStats(worker);
  assert(profile.tips().total_received() == 125'000);
  assert(profile.bounties().claimed_count() == 1);
  assert(profile.bounties().amount_earned() == 400'000);

  acp::events::EventFilter filter;
  filter.identity = worker;
  auto page       = fx.ledger.registry->ReadEvents(1, 1000, filter);
  assert(page.events.size() == 2);
  assert(acp::events::EventLog::TypeOf(page.events[0]) == acp::ledger::v1::EVENT_TYPE_TIP_SENT);
  assert(acp::events::EventLog::TypeOf(page.events[1]) == acp::ledger::v1::EVENT_TYPE_BOUNTY_CLAIMED);
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();

  const std::string identity = prefix + "-durable";
  uint64_t bounty_id = 0;
  uint64_t sequence  = 0;
  {
    auto tx = repo->Begin();
    repo->SetBalance(*tx, identity, 4242);
    BountyRecord b = MakeBounty(identity, 42, 0);
    repo->InsertBounty(*tx, b);
    EventRecord e = MakeEvent(acp::ledger::v1::EVENT_TYPE_BOUNTY_CREATED, 7, "durable");
    repo->AppendEvent(*tx, e);
    bounty_id = b.id;
    sequence  = e.sequence;
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetBalance(*tx, identity) == 4242);
  auto bounty = repo->GetBounty(*tx, bounty_id);
  assert(bounty.has_value() && bounty->amount == 42);

  auto events = repo->ReadEvents(*tx, sequence, 1);
  assert(events.size() == 1 && events[0].payload == "durable");

  // Counters continue past the restart.
  BountyRecord next = MakeBounty(identity, 1, 0);
  repo->InsertBounty(*tx, next);
  assert(next.id == bounty_id + 1);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if ACP_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("acp_ledger_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<acp::db::sqlite::SqliteDB>(db_path);
    db->ApplySchema();
    return std::make_shared<acp::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";

  // Runs first: the raw suites below store payloads that are not
  // serialized ledger events.
  VerifyLedgerScenario(backend.make_repository(), backend.name + "-scenario");
  {
    auto repo = backend.make_repository();

    VerifyTokenLedger(*repo, backend.name + "-token");
    VerifyCounters(*repo, backend.name + "-counters");
    VerifyBountyLifecycle(*repo, backend.name + "-bounty");
    VerifyFarDeadlines(*repo, backend.name + "-far");
    VerifyAgents(*repo, backend.name + "-agents");
    VerifyEventLog(*repo, backend.name + "-events");
    VerifyRollbackBehavior(*repo, backend.name + "-rollback");
  }

  VerifyRestartDurability(backend, backend.name);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if ACP_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "acp_integration_repository_parity: pass\n";
  return 0;
}
