#pragma once

#include <atomic>
#include <cstdint>

namespace acp::util {

/*
  Time source for the ledger.

  All timestamps and deadlines are unix seconds. The core never reads the
  system clock directly so tests can drive expiry.
*/
using UnixSeconds = uint64_t;

class Clock {
 public:
  virtual ~Clock() = default;

  virtual UnixSeconds Now() const = 0;
};

class SystemClock final : public Clock {
 public:
  UnixSeconds Now() const override;
};

class ManualClock final : public Clock {
 public:
  explicit ManualClock(UnixSeconds start) : now_(start) {
  }

  UnixSeconds Now() const override {
    return now_.load();
  }

  void Set(UnixSeconds t) {
    now_.store(t);
  }

  void Advance(UnixSeconds seconds) {
    now_.fetch_add(seconds);
  }

 private:
  std::atomic<UnixSeconds> now_;
};

} // namespace acp::util
