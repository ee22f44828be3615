#include "factory.hpp"

#include <stdexcept>
#include <utility>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#if ATELIER_DB_SQLITE
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if ATELIER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace atelier::factory {

using atelier::runtime::config::RuntimeConfig;
using observability::IntField;
using observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if ATELIER_DB_SQLITE
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) {
      throw std::runtime_error("database.sqlite.path must be set");
    }

    db::sqlite::SqliteOptions options;
    if (sqlite.has_wal_mode()) options.wal_mode = sqlite.wal_mode();
    if (sqlite.busy_timeout_ms() != 0) options.busy_timeout_ms = sqlite.busy_timeout_ms();

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), options);
    db::sql::RunMigrations(*sqlite_db, db::sql::Dialect::kSqlite);
    ATELIER_LOG_INFO("state backend ready", {StringField("backend", "sqlite"), StringField("path", sqlite.path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if ATELIER_DB_POSTGRES
    const auto& postgres = database.postgres();
    if (postgres.connection_uri().empty()) {
      throw std::runtime_error("database.postgres.connection_uri must be set");
    }

    const std::size_t max_connections = postgres.max_connections() == 0 ? 16 : postgres.max_connections();
    auto              pool            = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), max_connections);
    db::postgres::ApplySchema(*pool);
    ATELIER_LOG_INFO("state backend ready",
                     {StringField("backend", "postgres"), IntField("max_connections", static_cast<int64_t>(max_connections))});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  ATELIER_LOG_WARN("no database configured, agent state is kept in memory only");
  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<config::ConfigResolver> BuildResolver(const RuntimeConfig& config, util::EnvLookup env) {
  config::ResolverOptions options;
  if (!config.embedding().data_dir().empty()) {
    options.data_dir = config.embedding().data_dir();
  }
  return std::make_shared<config::ConfigResolver>(std::move(options), std::move(env));
}

Runtime Build(const RuntimeConfig& config, util::EnvLookup env) {
  Runtime runtime;
  runtime.repository  = BuildRepository(config);
  runtime.resolver    = BuildResolver(config, std::move(env));
  runtime.state_store = std::make_shared<state::AgentStateStore>(runtime.repository);
  return runtime;
}

} // namespace atelier::factory
