#pragma once

#include <string>
#include <string_view>

namespace acp::util {

inline constexpr std::string_view kZeroAddress = "0x0000000000000000000000000000000000000000";

// The empty identity and the all-zero address both mean "nobody".
inline bool IsZeroIdentity(std::string_view identity) {
  return identity.empty() || identity == kZeroAddress;
}

} // namespace acp::util
