#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/agent_state_record.hpp"

namespace atelier::state {

struct UpsertOptions {
  std::string user_id;
  std::string request_id;
};

struct MigrationResult {
  bool     legacy_table_found = false;
  uint64_t rows_discarded     = 0;
};

/*
  AgentStateStore

  Latest serialized agent state per session, one row per session_id.

  Thread-safety:
    All methods may be called concurrently. Concurrent Upsert() calls for
    one session leave a single row holding the last committed blob; lock
    contention is retried here and never reported as a conflict.

  Errors:
    std::invalid_argument  empty session_id
    util::StorageError     storage unavailable or retries exhausted
*/
class AgentStateStore {
 public:
  static constexpr int kMaxAttempts = 5;

  explicit AgentStateStore(std::shared_ptr<db::Repository> repository);

  void Upsert(const std::string& session_id, std::string state_blob, const UpsertOptions& options = {});

  // nullopt == NotFound
  std::optional<db::model::AgentStateRecord> Get(const std::string& session_id);

  // true when a row was removed
  bool Delete(const std::string& session_id);

  /*
    Drops the legacy "checkpoints" table after counting its rows.
    Idempotent: a second run reports {false, 0}.
  */
  MigrationResult MigrateFromLegacyCheckpoints();

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace atelier::state
