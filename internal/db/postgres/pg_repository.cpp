#include "pg_repository.hpp"

#include <cstddef>

namespace atelier::db::postgres {

namespace {

using Bytes = std::basic_string<std::byte>;

Bytes ToBytes(const std::string& s) {
  return Bytes(reinterpret_cast<const std::byte*>(s.data()), s.size());
}

std::string FromBytes(const Bytes& b) {
  return std::string(reinterpret_cast<const char*>(b.data()), b.size());
}

std::string OptionalText(const pqxx::field& f) {
  return f.is_null() ? std::string{} : std::string(f.c_str());
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::broken_connection*>(&e) != nullptr) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) != nullptr ||
      dynamic_cast<const pqxx::deadlock_detected*>(&e) != nullptr) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e) != nullptr) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::insufficient_resources*>(&e) != nullptr) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::UpsertAgentState(Transaction& t, const model::AgentStateRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_agent_state", r.session_id, r.user_id, r.request_id, ToBytes(r.state_blob), r.created_at_ms,
                               r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::AgentStateRecord> PgRepository::GetAgentState(Transaction& t, const std::string& session_id) {
  auto res = TX(t).Work().exec_prepared("get_agent_state", session_id);
  if (res.empty()) return std::nullopt;

  model::AgentStateRecord r;
  r.session_id    = res[0][0].c_str();
  r.user_id       = OptionalText(res[0][1]);
  r.request_id    = OptionalText(res[0][2]);
  r.state_blob    = FromBytes(res[0][3].as<Bytes>());
  r.created_at_ms = res[0][4].as<uint64_t>();
  r.updated_at_ms = res[0][5].as<uint64_t>();
  return r;
}

Result PgRepository::DeleteAgentState(Transaction& t, const std::string& session_id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_agent_state", session_id);
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<uint64_t> PgRepository::CountLegacyCheckpoints(Transaction& t) {
  auto& work   = TX(t).Work();
  auto  exists = work.exec("SELECT to_regclass('public.checkpoints') IS NOT NULL;");
  if (!exists[0][0].as<bool>()) {
    return std::nullopt;
  }

  auto count = work.exec("SELECT COUNT(*) FROM checkpoints;");
  return count[0][0].as<uint64_t>();
}

Result PgRepository::DropLegacyCheckpoints(Transaction& t) {
  try {
    TX(t).Work().exec("DROP TABLE IF EXISTS checkpoints CASCADE;");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

}
