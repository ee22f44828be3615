#pragma once

#include <functional>
#include <mutex>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace atelier::db::memory {

/*
  Transaction = snapshot + write log
*/

class MemoryTransaction final : public db::Transaction {
 public:
  using Write = std::function<void(MemoryRepository::State&)>;

  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;

  // Applies to the local view now and to the repository at commit.
  void Record(Write write);

  const MemoryRepository::State& View() const {
    return working_;
  }

  /*
    Serializes transactions touching the legacy checkpoint table, the way
    the SQL backends lock it, and refreshes the view of it from committed
    state. Held until Commit()/Rollback().
  */
  void LockLegacyCheckpoints();

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  std::vector<Write>      writes_;
  std::unique_lock<std::mutex> legacy_lock_;
  bool                    committed_   = false;
  bool                    rolled_back_ = false;
};

} // namespace atelier::db::memory
