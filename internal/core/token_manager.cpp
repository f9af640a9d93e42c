#include "internal/core/token_manager.hpp"

#include "internal/core/guards.hpp"
#include "internal/util/amount.hpp"

namespace acp::core {

TokenManager::TokenManager(LedgerContext ctx, std::shared_ptr<token::StoredToken> token, FaucetPolicy faucet)
    : ctx_(std::move(ctx)), token_(std::move(token)), faucet_(faucet) {
}

void TokenManager::Approve(const std::string& owner, const std::string& spender, uint64_t amount) {
  RequireIdentity(owner, "approve: owner");
  RequireIdentity(spender, "approve: spender");
  if (ctx_.accounts.Contains(owner)) {
    throw util::Unauthorized("approve: ledger accounts cannot grant allowances");
  }

  ctx_.sequencer->Run([&](util::UnixSeconds) {
    auto tx = ctx_.repository->Begin();
    if (!token_->Approve(*tx, owner, spender, amount)) {
      throw util::CustodyTransferFailed("approve: token rejected the allowance");
    }
    tx->Commit();
  });
}

uint64_t TokenManager::Faucet(const std::string& to, uint64_t whole_tokens) {
  if (!faucet_.enabled) {
    throw util::PreconditionFailed("faucet: disabled on this ledger");
  }
  RequireIdentity(to, "faucet: recipient");
  if (ctx_.accounts.Contains(to)) {
    throw util::InvalidArgument("faucet: cannot mint to a ledger account");
  }
  RequirePositive(whole_tokens, "faucet: amount");
  if (whole_tokens > faucet_.max_per_mint) {
    throw util::InvalidArgument("faucet: max " + std::to_string(faucet_.max_per_mint) + " " + token_->Symbol() + " per mint");
  }

  const uint64_t amount = util::CheckedMul(whole_tokens, util::UnitScale(token_->Decimals()), "faucet amount");

  return ctx_.sequencer->Run([&](util::UnixSeconds) {
    auto tx = ctx_.repository->Begin();
    if (!token_->Mint(*tx, to, amount)) {
      throw util::InvalidArgument("faucet: balance of " + to + " would overflow");
    }
    tx->Commit();
    return amount;
  });
}

uint64_t TokenManager::BalanceOf(const std::string& identity) {
  return ctx_.sequencer->Run([&](util::UnixSeconds) {
    auto tx = ctx_.repository->Begin();
    return token_->BalanceOf(*tx, identity);
  });
}

acp::ledger::v1::TokenInfo TokenManager::Info() const {
  acp::ledger::v1::TokenInfo info;
  info.set_symbol(token_->Symbol());
  info.set_decimals(token_->Decimals());
  info.set_tips_account(ctx_.accounts.tips);
  info.set_escrow_account(ctx_.accounts.escrow);
  info.set_faucet_enabled(faucet_.enabled);
  info.set_faucet_max_per_mint(faucet_.max_per_mint);
  return info;
}

} // namespace acp::core
