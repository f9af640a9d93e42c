#pragma once

#include <memory>
#include <string>

#include "acp/ledger/v1.hpp"
#include "internal/core/ledger_context.hpp"
#include "internal/token/stored_token.hpp"

namespace acp::core {

struct FaucetPolicy {
  bool     enabled      = false;
  uint64_t max_per_mint = 10000; // whole tokens
};

/*
  TokenManager

  Token-side operations exposed to agents: allowance approval and the
  development faucet.
*/
class TokenManager {
 public:
  TokenManager(LedgerContext ctx, std::shared_ptr<token::StoredToken> token, FaucetPolicy faucet);

  void Approve(const std::string& owner, const std::string& spender, uint64_t amount);

  // Mints whole_tokens * 10^decimals to `to`; returns the base units minted.
  uint64_t Faucet(const std::string& to, uint64_t whole_tokens);

  uint64_t BalanceOf(const std::string& identity);

  acp::ledger::v1::TokenInfo Info() const;

 private:
  LedgerContext                       ctx_;
  std::shared_ptr<token::StoredToken> token_;
  FaucetPolicy                        faucet_;
};

} // namespace acp::core
