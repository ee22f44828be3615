#pragma once

#include <string>
#include <vector>

namespace atelier::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

enum class Dialect {
  kSqlite,
  kPostgres,
};

struct Migration {
  int                      version = 0;
  std::string              description;
  std::vector<std::string> statements;
};

// Ordered by version. Every statement is idempotent.
std::vector<Migration> SchemaMigrations(Dialect dialect);

/*
  Runs migrations in order and records each version in
  atelier_schema_migrations. Re-running is a no-op.
*/
void RunMigrations(MigrationExecutor& executor, Dialect dialect);

} // namespace atelier::db::sql
