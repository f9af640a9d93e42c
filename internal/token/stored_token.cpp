#include "internal/token/stored_token.hpp"

#include <limits>
#include <stdexcept>

namespace acp::token {

namespace {

void ThrowIfFailed(const db::Result& result, const char* context) {
  if (!result) {
    throw std::runtime_error(std::string(context) + ": " + result.message);
  }
}

} // namespace

StoredToken::StoredToken(std::shared_ptr<db::Repository> repository, std::string symbol, uint32_t decimals)
    : repository_(std::move(repository)), symbol_(std::move(symbol)), decimals_(decimals) {
}

uint64_t StoredToken::BalanceOf(db::Transaction& tx, const std::string& owner) {
  return repository_->GetBalance(tx, owner);
}

uint64_t StoredToken::Allowance(db::Transaction& tx, const std::string& owner, const std::string& spender) {
  return repository_->GetAllowance(tx, owner, spender);
}

bool StoredToken::Approve(db::Transaction& tx, const std::string& owner, const std::string& spender, uint64_t amount) {
  ThrowIfFailed(repository_->SetAllowance(tx, owner, spender, amount), "token approve");
  return true;
}

bool StoredToken::Transfer(db::Transaction& tx, const std::string& from, const std::string& to, uint64_t amount) {
  return Move(tx, from, to, amount);
}

bool StoredToken::TransferFrom(db::Transaction& tx, const std::string& spender, const std::string& owner, const std::string& to,
                               uint64_t amount) {
  const uint64_t allowance = repository_->GetAllowance(tx, owner, spender);
  if (allowance < amount) {
    return false;
  }
  if (!Move(tx, owner, to, amount)) {
    return false;
  }
  ThrowIfFailed(repository_->SetAllowance(tx, owner, spender, allowance - amount), "token spend allowance");
  return true;
}

bool StoredToken::Mint(db::Transaction& tx, const std::string& to, uint64_t amount) {
  const uint64_t balance = repository_->GetBalance(tx, to);
  if (amount > std::numeric_limits<uint64_t>::max() - balance) {
    return false;
  }
  ThrowIfFailed(repository_->SetBalance(tx, to, balance + amount), "token mint");
  return true;
}

bool StoredToken::Move(db::Transaction& tx, const std::string& from, const std::string& to, uint64_t amount) {
  const uint64_t from_balance = repository_->GetBalance(tx, from);
  if (from_balance < amount) {
    return false;
  }
  if (from == to) {
    return true;
  }

  const uint64_t to_balance = repository_->GetBalance(tx, to);
  if (amount > std::numeric_limits<uint64_t>::max() - to_balance) {
    return false;
  }

  ThrowIfFailed(repository_->SetBalance(tx, from, from_balance - amount), "token debit");
  ThrowIfFailed(repository_->SetBalance(tx, to, to_balance + amount), "token credit");
  return true;
}

} // namespace acp::token
