#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "acp/ledger/v1.hpp"
#include "internal/db/api/repository.hpp"

namespace acp::events {

using acp::ledger::v1::EventType;
using acp::ledger::v1::LedgerEvent;

struct EventFilter {
  // EVENT_TYPE_UNSPECIFIED matches every type.
  EventType type = acp::ledger::v1::EVENT_TYPE_UNSPECIFIED;
  // Empty matches every event; otherwise any party named in the event.
  std::string identity;
};

struct EventPage {
  std::vector<LedgerEvent> events;
  // First sequence not yet examined; pass back to continue.
  uint64_t next_sequence = 1;
};

/*
  Append-only ledger event log.

  Append runs inside the operation's transaction, so an aborted
  operation leaves no event behind. Publish is called by the operation
  after commit, still inside the sequencer, which delivers events to
  subscribers in commit order.

  Subscribers run synchronously on the thread of the operation.
*/
class EventLog {
 public:
  using Subscriber = std::function<void(const LedgerEvent&)>;

  explicit EventLog(std::shared_ptr<db::Repository> repository);

  // Stores the event; returns it with its assigned sequence.
  LedgerEvent Append(db::Transaction& tx, LedgerEvent event);

  void Publish(const std::vector<LedgerEvent>& committed) const;

  // The subscriber runs while the operation still holds the sequencer;
  // a ledger call made from it fails with std::logic_error, which is
  // logged like any other subscriber failure. Hand events to another
  // thread to act on the ledger in response.
  uint64_t Subscribe(Subscriber subscriber);
  void     Unsubscribe(uint64_t id);

  EventPage Read(db::Transaction& tx, uint64_t start_sequence, uint64_t max_entries, const EventFilter& filter) const;

  static EventType TypeOf(const LedgerEvent& event);
  static bool      Involves(const LedgerEvent& event, const std::string& identity);
  static bool      Matches(const LedgerEvent& event, const EventFilter& filter);

 private:
  std::shared_ptr<db::Repository> repository_;

  mutable std::mutex             subscribers_mutex_;
  std::map<uint64_t, Subscriber> subscribers_;
  uint64_t                       next_subscriber_id_ = 1;
};

} // namespace acp::events
