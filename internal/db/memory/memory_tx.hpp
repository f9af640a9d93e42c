#pragma once

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace acp::db::memory {

/*
  Transaction = committed state + staged write set

  Commit applies the write set under the repository mutex. A write
  transaction fails with a conflict when another one committed after it
  began.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::WriteSet& Staged() {
    return staged_;
  }
  const MemoryRepository::WriteSet& Staged() const {
    return staged_;
  }

 private:
  void EnsureOpen() const;

  MemoryRepository&          repo_;
  MemoryRepository::WriteSet staged_;
  uint64_t                   base_version_ = 0;
  bool                       committed_    = false;
  bool                       rolled_back_  = false;

  friend class MemoryRepository;
};

} // namespace acp::db::memory
