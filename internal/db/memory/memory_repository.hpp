#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace atelier::db::memory {

class MemoryTransaction;

/*
  Process-local backend.

  Writes are recorded per transaction and replayed onto the committed
  state under the repository mutex at Commit(), so two transactions
  upserting the same session both succeed and the later commit wins.

  The legacy checkpoint table is the exception: a transaction counting or
  dropping it holds legacy_mutex_ until it finishes, so one migration
  observes the table and any concurrent one finds it gone.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertAgentState(Transaction&, const model::AgentStateRecord&) override;
  std::optional<model::AgentStateRecord> GetAgentState(Transaction&, const std::string&) override;
  Result DeleteAgentState(Transaction&, const std::string&) override;

  std::optional<uint64_t> CountLegacyCheckpoints(Transaction&) override;
  Result DropLegacyCheckpoints(Transaction&) override;

  // Stands in for a database that still carries the legacy table.
  void SeedLegacyCheckpoints(uint64_t rows);

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::AgentStateRecord> agent_states;
    std::optional<uint64_t> legacy_checkpoint_rows;
  };

  static void ApplyUpsert(State& state, const model::AgentStateRecord& record);

  std::mutex mutex_;
  State committed_;

  // taken before mutex_, never after
  std::mutex legacy_mutex_;
};

}
