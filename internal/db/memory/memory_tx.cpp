#include "memory_tx.hpp"

#include <stdexcept>

namespace acp::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  base_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::EnsureOpen() const {
  if (committed_ || rolled_back_) {
    throw std::logic_error("memory transaction already finished");
  }
}

void MemoryTransaction::Commit() {
  EnsureOpen();
  if (staged_.empty()) {
    committed_ = true;
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != base_version_) {
    throw std::runtime_error("transaction conflict: state was modified by a concurrent transaction");
  }
  repo_.Apply(std::move(staged_));
  repo_.committed_version_++;
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  staged_      = {};
  rolled_back_ = true;
}

} // namespace acp::db::memory
