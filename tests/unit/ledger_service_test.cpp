#include <cassert>
#include <iostream>
#include <string>

#include "internal/service/bounty_service.hpp"
#include "internal/service/registry_service.hpp"
#include "internal/service/tip_service.hpp"
#include "internal/service/token_service.hpp"
#include "internal/util/errors.hpp"
#include "support/ledger_fixture.hpp"

namespace {

using namespace acp::ledger::v1;
using acp::testing::LedgerFixture;
using acp::testing::Throws;

struct Services {
  explicit Services(LedgerFixture& f)
      : tips(f.ledger.Services()), bounties(f.ledger.Services()), registry(f.ledger.Services()), token(f.ledger.Services()) {
  }

  acp::service::TipService      tips;
  acp::service::BountyService   bounties;
  acp::service::RegistryService registry;
  acp::service::TokenService    token;
};

uint64_t Create(Services& s, const std::string& caller, uint64_t amount, uint64_t deadline = 0) {
  CreateBountyRequest req;
  req.set_caller(caller);
  req.set_amount(amount);
  req.set_deadline(deadline);
  req.set_description("task");
  return s.bounties.CreateBounty(req).bounty_id();
}

void TestFaucetApproveTipRoundTrip() {
  LedgerFixture f;
  Services      s(f);

  FaucetRequest faucet;
  faucet.set_caller("alice");
  faucet.set_whole_tokens(100);
  auto minted = s.token.Faucet(faucet);
  assert(minted.minted() == 100'000'000 && minted.balance() == 100'000'000);

  auto info = s.token.GetTokenInfo({}).info();

  ApproveRequest approve;
  approve.set_caller("alice");
  approve.set_spender(info.tips_account());
  approve.set_amount(5'000'000);
  s.token.Approve(approve);

  GetAllowancesRequest allowances;
  allowances.set_identity("alice");
  auto granted = s.registry.GetAllowances(allowances);
  assert(granted.tips_allowance() == 5'000'000 && granted.bounties_allowance() == 0);

  TipRequest tip;
  tip.set_caller("alice");
  tip.set_recipient("bob");
  tip.set_amount(2'500'000);
  tip.set_message("nice post");
  auto receipt = s.tips.Tip(tip);
  assert(receipt.event_sequence() == 1);

  GetTipStatsRequest stats;
  stats.set_identity("bob");
  assert(s.tips.GetTipStats(stats).stats().total_received() == 2'500'000);

  GetBalanceRequest balance;
  balance.set_identity("bob");
  assert(s.registry.GetBalance(balance).balance() == 2'500'000);
}

void TestBatchTipResponseCarriesTotal() {
  LedgerFixture f;
  f.Prepare("alice", 1'000);
  Services s(f);

  BatchTipRequest req;
  req.set_caller("alice");
  req.add_recipients("bob");
  req.add_amounts(10);
  req.add_recipients("carol");
  req.add_amounts(15);
  auto resp = s.tips.BatchTip(req);
  assert(resp.total_amount() == 25 && resp.event_sequence() == 1);

  req.add_recipients("dave");
  assert(Throws<acp::util::InvalidArgument>([&] { s.tips.BatchTip(req); }));
}

void TestApproveClaimReportsExpiry() {
  LedgerFixture f;
  f.Prepare("paula", 1'000);
  Services s(f);

  const auto id = Create(s, "paula", 400, acp::testing::kGenesis + 5);
  f.clock->Advance(6);

  ApproveClaimRequest req;
  req.set_caller("paula");
  req.set_bounty_id(id);
  req.set_claimer("quinn");
  auto resp = s.bounties.ApproveClaim(req);
  assert(resp.status() == BOUNTY_STATUS_EXPIRED);
  assert(resp.bounty().status() == BOUNTY_STATUS_EXPIRED);
  assert(f.Balance("paula") == 1'000);
}

void TestActiveListingPageSizes() {
  LedgerFixture f;
  f.Prepare("paula", 10'000);
  Services s(f);
  for (int i = 0; i < 30; ++i) Create(s, "paula", 1);

  ListActiveBountiesRequest req;
  assert(s.bounties.ListActiveBounties(req).bounties_size() == static_cast<int>(acp::service::kDefaultActivePageSize));

  req.set_limit(1'000'000);
  assert(s.bounties.ListActiveBounties(req).bounties_size() == 30);

  req.set_offset(28);
  auto tail = s.bounties.ListActiveBounties(req);
  assert(tail.bounties_size() == 2 && tail.bounties(0).id() == 29);

  GetPosterBountiesRequest posted;
  posted.set_identity("paula");
  assert(s.bounties.GetPosterBounties(posted).bounty_ids_size() == 30);
}

void TestReadEventsFiltersAndPages() {
  LedgerFixture f;
  f.Prepare("alice", 1'000);
  Services s(f);

  RegisterAgentRequest reg;
  reg.set_caller("alice");
  reg.set_name("Alice");
  s.registry.RegisterAgent(reg);
  for (int i = 0; i < 3; ++i) {
    TipRequest tip;
    tip.set_caller("alice");
    tip.set_recipient(i == 1 ? "carol" : "bob");
    tip.set_amount(1);
    s.tips.Tip(tip);
  }

  ReadEventsRequest req;
  req.set_identity("bob");
  auto bob = s.registry.ReadEvents(req);
  assert(bob.events_size() == 2);
  assert(bob.events(0).sequence() == 2 && bob.events(1).sequence() == 4);
  assert(bob.next_sequence() == 5);

  ReadEventsRequest typed;
  typed.set_type(EVENT_TYPE_AGENT_REGISTERED);
  auto regs = s.registry.ReadEvents(typed);
  assert(regs.events_size() == 1 && regs.events(0).agent_registered().name() == "Alice");

  GetAgentProfileRequest profile;
  profile.set_identity("alice");
  auto view = s.registry.GetAgentProfile(profile).profile();
  assert(view.name() == "Alice" && view.tips().total_sent() == 3);
}

void TestErrorsPropagateToTheCaller() {
  LedgerFixture f;
  Services      s(f);

  GetBountyRequest missing;
  missing.set_bounty_id(42);
  assert(Throws<acp::util::NotFound>([&] { s.bounties.GetBounty(missing); }));

  TipRequest tip;
  tip.set_caller("alice");
  tip.set_recipient("bob");
  tip.set_amount(1);
  assert(Throws<acp::util::CustodyTransferFailed>([&] { s.tips.Tip(tip); }));

  CancelBountyRequest cancel;
  cancel.set_caller("alice");
  cancel.set_bounty_id(1);
  assert(Throws<acp::util::NotFound>([&] { s.bounties.CancelBounty(cancel); }));
}

} // namespace

int main() {
  TestFaucetApproveTipRoundTrip();
  TestBatchTipResponseCarriesTotal();
  TestApproveClaimReportsExpiry();
  TestActiveListingPageSizes();
  TestReadEventsFiltersAndPages();
  TestErrorsPropagateToTheCaller();

  std::cout << "acp_unit_ledger_service: pass\n";
  return 0;
}
