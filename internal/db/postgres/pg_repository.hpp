#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace atelier::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertAgentState(Transaction&, const model::AgentStateRecord&) override;
  std::optional<model::AgentStateRecord> GetAgentState(Transaction&, const std::string&) override;
  Result DeleteAgentState(Transaction&, const std::string&) override;

  std::optional<uint64_t> CountLegacyCheckpoints(Transaction&) override;
  Result DropLegacyCheckpoints(Transaction&) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

}
