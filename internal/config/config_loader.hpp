#pragma once

#include <string>

#include "config/config.pb.h"

namespace acp::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset token and
  account fields are filled with their defaults afterwards.
*/
class ConfigLoader {
 public:
  static acp::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(acp::runtime::config::RuntimeConfig& config);
};

inline constexpr const char* kDefaultBindAddress   = "0.0.0.0:50061";
inline constexpr const char* kDefaultTokenSymbol   = "USDC";
inline constexpr uint32_t    kDefaultTokenDecimals = 6;
inline constexpr uint64_t    kDefaultFaucetMax     = 10000;
inline constexpr const char* kDefaultTipsAccount   = "acp:tips";
inline constexpr const char* kDefaultEscrowAccount = "acp:escrow";

} // namespace acp::config
