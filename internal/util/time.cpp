#include "time.hpp"

#include <chrono>

namespace acp::util {

UnixSeconds SystemClock::Now() const {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<UnixSeconds>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

} // namespace acp::util
