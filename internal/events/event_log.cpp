#include "internal/events/event_log.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace acp::events {

namespace {

using namespace acp::ledger::v1;

// Rows are scanned in chunks when a filter drops events.
constexpr uint64_t kScanChunk = 256;

} // namespace

EventLog::EventLog(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

EventType EventLog::TypeOf(const LedgerEvent& event) {
  switch (event.body_case()) {
    case LedgerEvent::kTipSent:
      return EVENT_TYPE_TIP_SENT;
    case LedgerEvent::kBatchTipSent:
      return EVENT_TYPE_BATCH_TIP_SENT;
    case LedgerEvent::kBountyCreated:
      return EVENT_TYPE_BOUNTY_CREATED;
    case LedgerEvent::kBountyClaimed:
      return EVENT_TYPE_BOUNTY_CLAIMED;
    case LedgerEvent::kBountyCancelled:
      return EVENT_TYPE_BOUNTY_CANCELLED;
    case LedgerEvent::kBountyExpired:
      return EVENT_TYPE_BOUNTY_EXPIRED;
    case LedgerEvent::kAgentRegistered:
      return EVENT_TYPE_AGENT_REGISTERED;
    case LedgerEvent::BODY_NOT_SET:
      break;
  }
  return EVENT_TYPE_UNSPECIFIED;
}

bool EventLog::Involves(const LedgerEvent& event, const std::string& identity) {
  switch (event.body_case()) {
    case LedgerEvent::kTipSent:
      return event.tip_sent().from() == identity || event.tip_sent().to() == identity;
    case LedgerEvent::kBatchTipSent: {
      const auto& body = event.batch_tip_sent();
      return body.from() == identity || std::find(body.recipients().begin(), body.recipients().end(), identity) != body.recipients().end();
    }
    case LedgerEvent::kBountyCreated:
      return event.bounty_created().poster() == identity;
    case LedgerEvent::kBountyClaimed:
      return event.bounty_claimed().poster() == identity || event.bounty_claimed().claimer() == identity;
    case LedgerEvent::kBountyCancelled:
      return event.bounty_cancelled().poster() == identity;
    case LedgerEvent::kBountyExpired:
      return event.bounty_expired().poster() == identity;
    case LedgerEvent::kAgentRegistered:
      return event.agent_registered().agent() == identity;
    case LedgerEvent::BODY_NOT_SET:
      break;
  }
  return false;
}

bool EventLog::Matches(const LedgerEvent& event, const EventFilter& filter) {
  if (filter.type != EVENT_TYPE_UNSPECIFIED && TypeOf(event) != filter.type) {
    return false;
  }
  return filter.identity.empty() || Involves(event, filter.identity);
}

LedgerEvent EventLog::Append(db::Transaction& tx, LedgerEvent event) {
  event.clear_sequence();

  db::model::EventRecord record;
  record.type      = TypeOf(event);
  record.timestamp = event.timestamp();
  if (record.type == EVENT_TYPE_UNSPECIFIED) {
    throw std::logic_error("ledger event has no body");
  }
  if (!event.SerializeToString(&record.payload)) {
    throw std::runtime_error("failed to serialize ledger event");
  }

  auto result = repository_->AppendEvent(tx, record);
  if (!result) {
    throw std::runtime_error("append event: " + result.message);
  }

  event.set_sequence(record.sequence);
  return event;
}

void EventLog::Publish(const std::vector<LedgerEvent>& committed) const {
  std::vector<Subscriber> subscribers;
  {
    std::scoped_lock lock(subscribers_mutex_);
    subscribers.reserve(subscribers_.size());
    for (const auto& [_, subscriber] : subscribers_) {
      subscribers.push_back(subscriber);
    }
  }

  for (const auto& event : committed) {
    for (const auto& subscriber : subscribers) {
      try {
        subscriber(event);
      } catch (const std::exception& e) {
        // operation is already committed; log and keep delivering
        ACP_LOG_WARN("event subscriber failed",
                     {observability::UintField("sequence", event.sequence()), observability::StringField("error", e.what())});
      }
    }
  }
}

uint64_t EventLog::Subscribe(Subscriber subscriber) {
  std::scoped_lock lock(subscribers_mutex_);
  const uint64_t   id = next_subscriber_id_++;
  subscribers_.emplace(id, std::move(subscriber));
  return id;
}

void EventLog::Unsubscribe(uint64_t id) {
  std::scoped_lock lock(subscribers_mutex_);
  subscribers_.erase(id);
}

EventPage EventLog::Read(db::Transaction& tx, uint64_t start_sequence, uint64_t max_entries, const EventFilter& filter) const {
  EventPage page;
  page.next_sequence = std::max<uint64_t>(start_sequence, 1);

  while (page.events.size() < max_entries) {
    const auto rows = repository_->ReadEvents(tx, page.next_sequence, kScanChunk);
    if (rows.empty()) {
      break;
    }

    for (const auto& row : rows) {
      page.next_sequence = row.sequence + 1;

      LedgerEvent event;
      if (!event.ParseFromString(row.payload)) {
        throw std::runtime_error("corrupt ledger event at sequence " + std::to_string(row.sequence));
      }
      event.set_sequence(row.sequence);

      if (Matches(event, filter)) {
        page.events.push_back(std::move(event));
        if (page.events.size() >= max_entries) {
          break;
        }
      }
    }
  }
  return page;
}

} // namespace acp::events
