#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/agent_state_record.hpp"

namespace atelier::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - UpsertAgentState is a single insert-or-replace on the session_id key;
    concurrent upserts of one session never produce a constraint error
  - At most one agent_state row per session_id

  Legacy checkpoint table:
    The old design kept checkpoints in a separate multi-row table
    ("checkpoints") whose uniqueness constraint did not match the upsert
    key. It is only ever counted and dropped, never read row by row.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Agent state (latest snapshot per session)
  // ---------------------------------------------------------------------

  // created_at_ms of an existing row is preserved.
  virtual Result UpsertAgentState(Transaction&, const model::AgentStateRecord&) = 0;

  virtual std::optional<model::AgentStateRecord> GetAgentState(Transaction&, const std::string& session_id) = 0;

  // NotFound when no row existed.
  virtual Result DeleteAgentState(Transaction&, const std::string& session_id) = 0;

  // ---------------------------------------------------------------------
  // Legacy checkpoints
  // ---------------------------------------------------------------------

  // nullopt when the legacy table does not exist.
  virtual std::optional<uint64_t> CountLegacyCheckpoints(Transaction&) = 0;

  virtual Result DropLegacyCheckpoints(Transaction&) = 0;
};

} // namespace atelier::db
