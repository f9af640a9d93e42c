#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace acp::db::memory {

namespace {

template <typename Map, typename Key>
const typename Map::mapped_type* Lookup(const Map& map, const Key& key) {
  auto it = map.find(key);
  return it == map.end() ? nullptr : &it->second;
}

template <typename T>
std::optional<T> Layered(const std::unordered_map<std::string, T>& staged, const std::unordered_map<std::string, T>& committed,
                         const std::string& key) {
  if (auto* v = Lookup(staged, key)) return *v;
  if (auto* v = Lookup(committed, key)) return *v;
  return std::nullopt;
}

std::vector<uint64_t> Concat(const std::vector<uint64_t>* base, const std::vector<uint64_t>* appended) {
  std::vector<uint64_t> out;
  if (base) out = *base;
  if (appended) out.insert(out.end(), appended->begin(), appended->end());
  return out;
}

} // namespace

bool MemoryRepository::WriteSet::empty() const {
  return balances.empty() && allowances.empty() && tip_stats.empty() && bounty_stats.empty() && bounties.empty() &&
         claimer_appends.empty() && agents.empty() && events.empty();
}

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ---------------------------------------------------------------------------
// Token ledger
// ---------------------------------------------------------------------------

uint64_t MemoryRepository::GetBalance(Transaction& t, const std::string& identity) {
  const auto& staged = TX(t).Staged();
  if (auto* v = Lookup(staged.balances, identity)) return *v;

  std::scoped_lock lock(mutex_);
  auto* v = Lookup(committed_.balances, identity);
  return v ? *v : 0;
}

Result MemoryRepository::SetBalance(Transaction& t, const std::string& identity, uint64_t amount) {
  TX(t).Staged().balances[identity] = amount;
  return Result::Ok();
}

uint64_t MemoryRepository::GetAllowance(Transaction& t, const std::string& owner, const std::string& spender) {
  const AllowanceKey key{owner, spender};
  const auto&        staged = TX(t).Staged();
  if (auto* v = Lookup(staged.allowances, key)) return *v;

  std::scoped_lock lock(mutex_);
  auto* v = Lookup(committed_.allowances, key);
  return v ? *v : 0;
}

Result MemoryRepository::SetAllowance(Transaction& t, const std::string& owner, const std::string& spender, uint64_t amount) {
  TX(t).Staged().allowances[AllowanceKey{owner, spender}] = amount;
  return Result::Ok();
}

// ---------------------------------------------------------------------------
// Counters
// ---------------------------------------------------------------------------

std::optional<model::TipStatsRecord> MemoryRepository::GetTipStats(Transaction& t, const std::string& identity) {
  std::scoped_lock lock(mutex_);
  return Layered(TX(t).Staged().tip_stats, committed_.tip_stats, identity);
}

Result MemoryRepository::UpsertTipStats(Transaction& t, const model::TipStatsRecord& r) {
  TX(t).Staged().tip_stats[r.identity] = r;
  return Result::Ok();
}

std::optional<model::BountyStatsRecord> MemoryRepository::GetBountyStats(Transaction& t, const std::string& identity) {
  std::scoped_lock lock(mutex_);
  return Layered(TX(t).Staged().bounty_stats, committed_.bounty_stats, identity);
}

Result MemoryRepository::UpsertBountyStats(Transaction& t, const model::BountyStatsRecord& r) {
  TX(t).Staged().bounty_stats[r.identity] = r;
  return Result::Ok();
}

// ---------------------------------------------------------------------------
// Bounties
// ---------------------------------------------------------------------------

std::optional<model::BountyRecord> MemoryRepository::FindBounty(const WriteSet& staged, uint64_t id) const {
  if (auto* v = Lookup(staged.bounties, id)) return *v;
  if (id == 0 || id > committed_.bounties.size()) return std::nullopt;
  return committed_.bounties[id - 1];
}

Result MemoryRepository::InsertBounty(Transaction& t, model::BountyRecord& r) {
  auto& staged = TX(t).Staged();

  std::scoped_lock lock(mutex_);
  r.id = committed_.bounties.size() + staged.inserted_bounties + 1;
  staged.inserted_bounties++;

  staged.bounties[r.id] = r;
  staged.poster_appends[r.poster].push_back(r.id);
  if (r.status == acp::ledger::v1::BOUNTY_STATUS_ACTIVE) {
    staged.activated.insert(r.id);
  }
  return Result::Ok();
}

std::optional<model::BountyRecord> MemoryRepository::GetBounty(Transaction& t, uint64_t id) {
  std::scoped_lock lock(mutex_);
  return FindBounty(TX(t).Staged(), id);
}

Result MemoryRepository::UpdateBounty(Transaction& t, const model::BountyRecord& r) {
  auto& staged = TX(t).Staged();
  {
    std::scoped_lock lock(mutex_);
    if (!FindBounty(staged, r.id)) return Result::Err(ErrorCode::NotFound, "bounty " + std::to_string(r.id));
  }

  staged.bounties[r.id] = r;
  if (r.status == acp::ledger::v1::BOUNTY_STATUS_ACTIVE) {
    staged.deactivated.erase(r.id);
    staged.activated.insert(r.id);
  } else {
    staged.activated.erase(r.id);
    staged.deactivated.insert(r.id);
  }
  return Result::Ok();
}

std::vector<uint64_t> MemoryRepository::GetPosterBounties(Transaction& t, const std::string& identity) {
  std::scoped_lock lock(mutex_);
  return Concat(Lookup(committed_.poster_bounties, identity), Lookup(TX(t).Staged().poster_appends, identity));
}

Result MemoryRepository::AppendClaimerBounty(Transaction& t, const std::string& claimer, uint64_t bounty_id) {
  TX(t).Staged().claimer_appends[claimer].push_back(bounty_id);
  return Result::Ok();
}

std::vector<uint64_t> MemoryRepository::GetClaimerBounties(Transaction& t, const std::string& identity) {
  std::scoped_lock lock(mutex_);
  return Concat(Lookup(committed_.claimer_bounties, identity), Lookup(TX(t).Staged().claimer_appends, identity));
}

std::vector<model::BountyRecord> MemoryRepository::ListActiveBounties(Transaction& t, uint64_t now, uint64_t offset, uint64_t limit) {
  std::vector<model::BountyRecord> out;
  if (limit == 0) return out;

  const auto&      staged = TX(t).Staged();
  std::scoped_lock lock(mutex_);

  // merge committed ids (minus the ones this transaction closed) with ids it opened
  auto c     = committed_.active_bounties.begin();
  auto c_end = committed_.active_bounties.end();
  auto s     = staged.activated.begin();
  auto s_end = staged.activated.end();

  uint64_t matched = 0;
  while (c != c_end || s != s_end) {
    uint64_t id;
    if (s == s_end || (c != c_end && *c < *s)) {
      id = *c++;
      if (staged.deactivated.contains(id)) continue;
    } else {
      if (c != c_end && *c == *s) ++c;
      id = *s++;
    }

    auto bounty = FindBounty(staged, id);
    if (!bounty) continue;
    if (bounty->deadline != 0 && now > bounty->deadline) continue;

    if (matched++ < offset) continue;
    out.push_back(std::move(*bounty));
    if (out.size() >= limit) break;
  }
  return out;
}

// ---------------------------------------------------------------------------
// Agents
// ---------------------------------------------------------------------------

std::optional<model::AgentRecord> MemoryRepository::GetAgent(Transaction& t, const std::string& identity) {
  std::scoped_lock lock(mutex_);
  return Layered(TX(t).Staged().agents, committed_.agents, identity);
}

Result MemoryRepository::UpsertAgent(Transaction& t, const model::AgentRecord& r) {
  TX(t).Staged().agents[r.identity] = r;
  return Result::Ok();
}

// ---------------------------------------------------------------------------
// Event log
// ---------------------------------------------------------------------------

Result MemoryRepository::AppendEvent(Transaction& t, model::EventRecord& r) {
  auto& staged = TX(t).Staged();

  std::scoped_lock lock(mutex_);
  r.sequence = committed_.events.size() + staged.events.size() + 1;
  staged.events.push_back(r);
  return Result::Ok();
}

std::vector<model::EventRecord> MemoryRepository::ReadEvents(Transaction& t, uint64_t start_sequence, uint64_t max_entries) {
  std::vector<model::EventRecord> out;
  const auto&                     staged = TX(t).Staged();
  const uint64_t                  first  = std::max<uint64_t>(start_sequence, 1);

  std::scoped_lock lock(mutex_);
  const uint64_t   committed_count = committed_.events.size();
  for (uint64_t seq = first; out.size() < max_entries; ++seq) {
    if (seq <= committed_count) {
      out.push_back(committed_.events[seq - 1]);
    } else if (seq - committed_count <= staged.events.size()) {
      out.push_back(staged.events[seq - committed_count - 1]);
    } else {
      break;
    }
  }
  return out;
}

// ---------------------------------------------------------------------------
// Commit
// ---------------------------------------------------------------------------

// Caller holds mutex_.
void MemoryRepository::Apply(WriteSet&& staged) {
  for (auto& [identity, amount] : staged.balances) committed_.balances[identity] = amount;
  for (auto& [key, amount] : staged.allowances) committed_.allowances[key] = amount;
  for (auto& [identity, r] : staged.tip_stats) committed_.tip_stats[identity] = std::move(r);
  for (auto& [identity, r] : staged.bounty_stats) committed_.bounty_stats[identity] = std::move(r);

  // ascending id order keeps inserts contiguous
  for (auto& [id, r] : staged.bounties) {
    if (id <= committed_.bounties.size()) {
      committed_.bounties[id - 1] = std::move(r);
    } else {
      committed_.bounties.push_back(std::move(r));
    }
  }
  for (auto& [identity, ids] : staged.poster_appends) {
    auto& list = committed_.poster_bounties[identity];
    list.insert(list.end(), ids.begin(), ids.end());
  }
  for (auto& [identity, ids] : staged.claimer_appends) {
    auto& list = committed_.claimer_bounties[identity];
    list.insert(list.end(), ids.begin(), ids.end());
  }
  for (uint64_t id : staged.deactivated) committed_.active_bounties.erase(id);
  committed_.active_bounties.insert(staged.activated.begin(), staged.activated.end());

  for (auto& [identity, r] : staged.agents) committed_.agents[identity] = std::move(r);

  for (auto& r : staged.events) committed_.events.push_back(std::move(r));
}

} // namespace acp::db::memory
