#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

#include "internal/util/time.hpp"

namespace acp::core {

/*
  Process-wide operation sequencer.

  Every ledger operation, mutating or not, runs under one lock and sees
  a single clock reading taken on entry. The lock also serializes use
  of the repository connection.

  Committed events are published while the lock is held, so a nested
  Run on the owning thread (an event subscriber calling back into the
  ledger) throws std::logic_error instead of deadlocking.
*/
class Sequencer {
 public:
  explicit Sequencer(std::shared_ptr<util::Clock> clock) : clock_(std::move(clock)) {
  }

  template <typename Fn>
  decltype(auto) Run(Fn&& fn) {
    if (owner_.load() == std::this_thread::get_id()) {
      throw std::logic_error("ledger operation started from inside another ledger operation");
    }
    std::scoped_lock lock(mutex_);
    OwnerScope       owner(owner_);
    return std::forward<Fn>(fn)(clock_->Now());
  }

  const util::Clock& Clock() const {
    return *clock_;
  }

 private:
  struct OwnerScope {
    explicit OwnerScope(std::atomic<std::thread::id>& owner) : owner_(owner) {
      owner_.store(std::this_thread::get_id());
    }
    ~OwnerScope() {
      owner_.store(std::thread::id());
    }
    std::atomic<std::thread::id>& owner_;
  };

  std::shared_ptr<util::Clock> clock_;
  std::mutex                   mutex_;
  std::atomic<std::thread::id> owner_{};
};

} // namespace acp::core
