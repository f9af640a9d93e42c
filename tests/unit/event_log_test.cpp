#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/events/event_log.hpp"
#include "support/ledger_fixture.hpp"

namespace {

using acp::events::EventFilter;
using acp::events::EventLog;
using acp::ledger::v1::LedgerEvent;

LedgerEvent Tip(const std::string& from, const std::string& to, uint64_t amount, uint64_t ts) {
  LedgerEvent e;
  e.set_timestamp(ts);
  auto* body = e.mutable_tip_sent();
  body->set_from(from);
  body->set_to(to);
  body->set_amount(amount);
  return e;
}

LedgerEvent Registered(const std::string& agent) {
  LedgerEvent e;
  e.set_timestamp(1);
  e.mutable_agent_registered()->set_agent(agent);
  return e;
}

void TestAppendAssignsSequenceAndRollbackDropsEvent() {
  auto     repo = std::make_shared<acp::db::memory::MemoryRepository>();
  EventLog log(repo);

  {
    auto tx       = repo->Begin();
    auto appended = log.Append(*tx, Tip("alice", "bob", 5, 10));
    assert(appended.sequence() == 1);
    tx->Commit();
  }
  {
    auto tx = repo->Begin();
    (void)log.Append(*tx, Tip("alice", "carol", 6, 11));
    // abandoned
  }

  auto tx   = repo->Begin();
  auto page = log.Read(*tx, 1, 10, {});
  assert(page.events.size() == 1);
  assert(page.events[0].sequence() == 1);
  assert(page.events[0].timestamp() == 10);
  assert(page.events[0].tip_sent().to() == "bob");
  assert(page.next_sequence == 2);

  auto next = log.Append(*tx, Registered("dave"));
  assert(next.sequence() == 2);
}

void TestEventWithoutBodyIsRejected() {
  auto     repo = std::make_shared<acp::db::memory::MemoryRepository>();
  EventLog log(repo);
  auto     tx = repo->Begin();

  bool threw = false;
  try {
    (void)log.Append(*tx, LedgerEvent{});
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
}

void TestReadFiltersByTypeAndIdentity() {
  auto     repo = std::make_shared<acp::db::memory::MemoryRepository>();
  EventLog log(repo);
  {
    auto tx = repo->Begin();
    log.Append(*tx, Tip("alice", "bob", 1, 1));
    log.Append(*tx, Registered("carol"));
    log.Append(*tx, Tip("carol", "alice", 2, 2));
    log.Append(*tx, Tip("bob", "carol", 3, 3));

    LedgerEvent batch;
    batch.set_timestamp(4);
    batch.mutable_batch_tip_sent()->set_from("dave");
    batch.mutable_batch_tip_sent()->add_recipients("alice");
    batch.mutable_batch_tip_sent()->add_amounts(4);
    log.Append(*tx, batch);
    tx->Commit();
  }

  auto tx = repo->Begin();

  EventFilter by_alice;
  by_alice.identity = "alice";
  auto alice = log.Read(*tx, 1, 100, by_alice);
  assert(alice.events.size() == 3);
  assert(alice.events[0].sequence() == 1 && alice.events[1].sequence() == 3 && alice.events[2].sequence() == 5);

  EventFilter registrations;
  registrations.type = acp::ledger::v1::EVENT_TYPE_AGENT_REGISTERED;
  auto regs = log.Read(*tx, 1, 100, registrations);
  assert(regs.events.size() == 1 && regs.events[0].agent_registered().agent() == "carol");

  // paging resumes where the previous page stopped
  auto first = log.Read(*tx, 1, 2, by_alice);
  assert(first.events.size() == 2);
  auto rest = log.Read(*tx, first.next_sequence, 2, by_alice);
  assert(rest.events.size() == 1 && rest.events[0].sequence() == 5);
  assert(rest.next_sequence == 6);

  auto none = log.Read(*tx, 6, 10, {});
  assert(none.events.empty() && none.next_sequence == 6);
}

void TestPublishDeliversInOrderDespiteFailingSubscriber() {
  auto     repo = std::make_shared<acp::db::memory::MemoryRepository>();
  EventLog log(repo);

  std::vector<uint64_t> seen;
  log.Subscribe([](const LedgerEvent&) { throw std::runtime_error("subscriber bug"); });
  auto id = log.Subscribe([&seen](const LedgerEvent& e) { seen.push_back(e.sequence()); });

  LedgerEvent a = Tip("alice", "bob", 1, 1);
  a.set_sequence(1);
  LedgerEvent b = Tip("alice", "bob", 2, 2);
  b.set_sequence(2);
  log.Publish({a, b});
  assert((seen == std::vector<uint64_t>{1, 2}));

  log.Unsubscribe(id);
  log.Publish({a});
  assert(seen.size() == 2);
}

void TestSubscriberCallingBackIntoLedgerFailsFast() {
  acp::testing::LedgerFixture f;
  f.Prepare("alice", 1'000);

  int  calls    = 0;
  bool rejected = false;
  f.ledger.events->Subscribe([&](const LedgerEvent&) {
    ++calls;
    try {
      f.ledger.registry->GetBalance("bob");
    } catch (const std::logic_error&) {
      rejected = true;
      throw;
    }
  });

  auto receipt = f.ledger.tips->Tip("alice", "bob", 10, "", "");
  assert(calls == 1);
  assert(rejected);

  // the tip committed and the ledger is usable afterwards
  assert(receipt.total_amount == 10);
  assert(f.Balance("bob") == 10);
  assert(f.Balance("alice") == 990);
}

void TestInvolvesCoversEveryParty() {
  LedgerEvent claimed;
  claimed.mutable_bounty_claimed()->set_poster("paula");
  claimed.mutable_bounty_claimed()->set_claimer("quinn");
  assert(EventLog::Involves(claimed, "paula"));
  assert(EventLog::Involves(claimed, "quinn"));
  assert(!EventLog::Involves(claimed, "rita"));
  assert(EventLog::TypeOf(claimed) == acp::ledger::v1::EVENT_TYPE_BOUNTY_CLAIMED);
}

} // namespace

int main() {
  TestAppendAssignsSequenceAndRollbackDropsEvent();
  TestEventWithoutBodyIsRejected();
  TestReadFiltersByTypeAndIdentity();
  TestPublishDeliversInOrderDespiteFailingSubscriber();
  TestSubscriberCallingBackIntoLedgerFailsFast();
  TestInvolvesCoversEveryParty();

  std::cout << "acp_unit_event_log: pass\n";
  return 0;
}
