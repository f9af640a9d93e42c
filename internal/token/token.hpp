#pragma once

#include <cstdint>
#include <string>

#include "internal/db/api/transaction.hpp"

namespace acp::token {

/*
  Fungible token interface the ledger is written against.

  Every call runs inside the caller's transaction so token movement
  commits or rolls back together with the ledger effects. Mutations
  report failure by returning false; the caller aborts the operation.
*/
class Token {
 public:
  virtual ~Token() = default;

  virtual uint64_t BalanceOf(db::Transaction& tx, const std::string& owner) = 0;

  virtual uint64_t Allowance(db::Transaction& tx, const std::string& owner, const std::string& spender) = 0;

  // Overwrites the allowance of spender over owner's balance.
  virtual bool Approve(db::Transaction& tx, const std::string& owner, const std::string& spender, uint64_t amount) = 0;

  virtual bool Transfer(db::Transaction& tx, const std::string& from, const std::string& to, uint64_t amount) = 0;

  // Moves amount from owner to `to`, spending spender's allowance.
  virtual bool TransferFrom(db::Transaction& tx, const std::string& spender, const std::string& owner, const std::string& to,
                            uint64_t amount) = 0;
};

} // namespace acp::token
