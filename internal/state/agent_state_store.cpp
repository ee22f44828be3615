#include "agent_state_store.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace atelier::state {

using db::ErrorCode;
using db::Result;
using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

void RequireSessionId(const std::string& session_id) {
  if (session_id.empty()) {
    throw std::invalid_argument("session_id must not be empty");
  }
}

[[noreturn]] void ThrowDbError(const Result& result, const std::string& context) {
  throw util::StorageError(context + ": " + db::ToString(result.code) + (result.message.empty() ? "" : " (" + result.message + ")"));
}

/*
  Backends translate their own errors into Result or StorageError; anything
  else escaping a repository call (a dropped pqxx connection mid-commit) is
  still a storage failure to the caller.
*/
template <typename Fn>
auto Guard(const std::string& context, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const util::StorageError&) {
    throw;
  } catch (const std::invalid_argument&) {
    throw;
  } catch (const std::exception& e) {
    throw util::StorageError(context + ": " + e.what());
  }
}

} // namespace

AgentStateStore::AgentStateStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("AgentStateStore requires a repository");
  }
}

void AgentStateStore::Upsert(const std::string& session_id, std::string state_blob, const UpsertOptions& options) {
  RequireSessionId(session_id);

  const auto now = util::NowMs();
  const db::model::AgentStateRecord record{
      .session_id    = session_id,
      .state_blob    = std::move(state_blob),
      .user_id       = options.user_id,
      .request_id    = options.request_id,
      .created_at_ms = now,
      .updated_at_ms = now,
  };

  Result last;
  for (int attempt = 1; attempt <= kMaxAttempts; ++attempt) {
    last = Guard("upsert agent state", [&] {
      try {
        auto tx     = repository_->Begin();
        auto result = repository_->UpsertAgentState(*tx, record);
        if (result) {
          tx->Commit();
        }
        return result;
      } catch (const util::StorageBusy& e) {
        return Result::Err(ErrorCode::Busy, e.what());
      }
    });

    if (last) {
      ATELIER_LOG_DEBUG("agent state upserted",
                        {StringField("session_id", session_id), IntField("bytes", static_cast<int64_t>(record.state_blob.size()))});
      return;
    }
    if (!last.IsTransient()) {
      break;
    }

    ATELIER_LOG_WARN("agent state upsert contended, retrying",
                     {StringField("session_id", session_id), IntField("attempt", attempt), StringField("code", db::ToString(last.code))});
    std::this_thread::sleep_for(std::chrono::milliseconds(10 * attempt));
  }

  ThrowDbError(last, "upsert agent state");
}

std::optional<db::model::AgentStateRecord> AgentStateStore::Get(const std::string& session_id) {
  RequireSessionId(session_id);

  return Guard("get agent state", [&] {
    auto tx     = repository_->Begin();
    auto record = repository_->GetAgentState(*tx, session_id);
    tx->Commit();
    return record;
  });
}

bool AgentStateStore::Delete(const std::string& session_id) {
  RequireSessionId(session_id);

  const auto result = Guard("delete agent state", [&] {
    auto tx      = repository_->Begin();
    auto removed = repository_->DeleteAgentState(*tx, session_id);
    if (removed) {
      tx->Commit();
    }
    return removed;
  });

  if (result) {
    ATELIER_LOG_INFO("agent state deleted", {StringField("session_id", session_id)});
    return true;
  }
  if (result.code == ErrorCode::NotFound) {
    return false;
  }
  ThrowDbError(result, "delete agent state");
}

MigrationResult AgentStateStore::MigrateFromLegacyCheckpoints() {
  const auto migration = Guard("migrate legacy checkpoints", [&] {
    auto tx    = repository_->Begin();
    auto count = repository_->CountLegacyCheckpoints(*tx);
    if (!count) {
      tx->Commit();
      return MigrationResult{};
    }

    auto result = repository_->DropLegacyCheckpoints(*tx);
    if (!result) {
      ThrowDbError(result, "drop legacy checkpoints");
    }
    tx->Commit();
    return MigrationResult{.legacy_table_found = true, .rows_discarded = *count};
  });

  ATELIER_LOG_INFO("legacy checkpoint migration finished",
                   {BoolField("legacy_table_found", migration.legacy_table_found),
                    IntField("rows_discarded", static_cast<int64_t>(migration.rows_discarded))});
  return migration;
}

} // namespace atelier::state
