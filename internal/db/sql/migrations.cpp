#include "migrations.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace atelier::db::sql {

namespace {

std::string CreateMigrationsTable(Dialect dialect) {
  if (dialect == Dialect::kPostgres) {
    return "CREATE TABLE IF NOT EXISTS atelier_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms BIGINT NOT NULL);";
  }
  return "CREATE TABLE IF NOT EXISTS atelier_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);";
}

std::string RecordVersion(int version) {
  return "INSERT INTO atelier_schema_migrations(version, applied_at_ms) VALUES(" + std::to_string(version) + ", " +
         std::to_string(util::NowMs()) + ") ON CONFLICT(version) DO NOTHING;";
}

} // namespace

std::vector<Migration> SchemaMigrations(Dialect dialect) {
  std::vector<Migration> migrations;

  if (dialect == Dialect::kPostgres) {
    migrations.push_back(Migration{
        .version     = 1,
        .description = "agent_state keyed by session_id",
        .statements  = {"CREATE TABLE IF NOT EXISTS agent_state (session_id TEXT PRIMARY KEY, user_id TEXT, request_id TEXT, state_blob BYTEA NOT NULL, "
                        "created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);",
                        "CREATE INDEX IF NOT EXISTS agent_state_user_id_idx ON agent_state(user_id);"},
    });
  } else {
    migrations.push_back(Migration{
        .version     = 1,
        .description = "agent_state keyed by session_id",
        .statements  = {"CREATE TABLE IF NOT EXISTS agent_state (session_id TEXT PRIMARY KEY, user_id TEXT, request_id TEXT, state_blob BLOB NOT NULL, "
                        "created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
                        "CREATE INDEX IF NOT EXISTS agent_state_user_id_idx ON agent_state(user_id);"},
    });
  }

  return migrations;
}

void RunMigrations(MigrationExecutor& executor, Dialect dialect) {
  executor.ExecuteSQL(CreateMigrationsTable(dialect));

  for (const auto& migration : SchemaMigrations(dialect)) {
    for (const auto& statement : migration.statements) {
      executor.ExecuteSQL(statement);
    }
    executor.ExecuteSQL(RecordVersion(migration.version));
    ATELIER_LOG_DEBUG("schema migration applied",
                      {observability::IntField("version", migration.version), observability::StringField("description", migration.description)});
  }
}

} // namespace atelier::db::sql
