#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"
#include "internal/core/ledger_context.hpp"
#include "internal/util/identity.hpp"

namespace acp::core {

inline void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw std::runtime_error(message);
  }
}

inline void RequireIdentity(const std::string& identity, const std::string& what) {
  if (util::IsZeroIdentity(identity)) {
    throw util::InvalidArgument(what + " must be a non-zero identity");
  }
}

// Tokens sent to a ledger account outside its own operations could
// never leave it again.
inline void RequireNotLedgerAccount(const std::string& identity, const LedgerAccounts& accounts, const std::string& what) {
  if (accounts.Contains(identity)) {
    throw util::InvalidArgument(what + " must not be a ledger account");
  }
}

inline void RequirePositive(uint64_t amount, const std::string& what) {
  if (amount == 0) {
    throw util::InvalidArgument(what + " must be greater than zero");
  }
}

} // namespace acp::core
