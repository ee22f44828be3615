#include "memory_tx.hpp"

#include <stdexcept>

namespace atelier::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Record(Write write) {
  if (committed_ || rolled_back_) {
    throw std::logic_error("write on a finished transaction");
  }
  write(working_);
  writes_.push_back(std::move(write));
}

void MemoryTransaction::LockLegacyCheckpoints() {
  if (legacy_lock_.owns_lock()) {
    return;
  }
  legacy_lock_ = std::unique_lock(repo_.legacy_mutex_);

  std::scoped_lock lock(repo_.mutex_);
  working_.legacy_checkpoint_rows = repo_.committed_.legacy_checkpoint_rows;
}

void MemoryTransaction::Commit() {
  {
    std::scoped_lock lock(repo_.mutex_);
    for (const auto& write : writes_) {
      write(repo_.committed_);
    }
  }
  writes_.clear();
  committed_ = true;
  if (legacy_lock_.owns_lock()) legacy_lock_.unlock();
}

void MemoryTransaction::Rollback() {
  writes_.clear();
  rolled_back_ = true;
  if (legacy_lock_.owns_lock()) legacy_lock_.unlock();
}

} // namespace atelier::db::memory
