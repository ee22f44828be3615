#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace atelier::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertAgentState(Transaction&, const model::AgentStateRecord&) override;
  std::optional<model::AgentStateRecord> GetAgentState(Transaction&, const std::string&) override;
  Result DeleteAgentState(Transaction&, const std::string&) override;

  std::optional<uint64_t> CountLegacyCheckpoints(Transaction&) override;
  Result DropLegacyCheckpoints(Transaction&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
