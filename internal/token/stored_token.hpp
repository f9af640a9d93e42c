#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/token/token.hpp"

namespace acp::token {

/*
  Token kept in the ledger's own repository (balances and allowances
  tables). Standard semantics: no fees, no rebasing, success reported
  by the return value.
*/
class StoredToken final : public Token {
 public:
  StoredToken(std::shared_ptr<db::Repository> repository, std::string symbol, uint32_t decimals);

  uint64_t BalanceOf(db::Transaction& tx, const std::string& owner) override;
  uint64_t Allowance(db::Transaction& tx, const std::string& owner, const std::string& spender) override;
  bool     Approve(db::Transaction& tx, const std::string& owner, const std::string& spender, uint64_t amount) override;
  bool     Transfer(db::Transaction& tx, const std::string& from, const std::string& to, uint64_t amount) override;
  bool     TransferFrom(db::Transaction& tx, const std::string& spender, const std::string& owner, const std::string& to,
                        uint64_t amount) override;

  // Credits new units to `to`; false when the balance would overflow.
  bool Mint(db::Transaction& tx, const std::string& to, uint64_t amount);

  const std::string& Symbol() const {
    return symbol_;
  }
  uint32_t Decimals() const {
    return decimals_;
  }

 private:
  bool Move(db::Transaction& tx, const std::string& from, const std::string& to, uint64_t amount);

  std::shared_ptr<db::Repository> repository_;
  std::string                     symbol_;
  uint32_t                        decimals_;
};

} // namespace acp::token
