#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace atelier::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

void MemoryRepository::ApplyUpsert(State& state, const model::AgentStateRecord& record) {
  auto [it, inserted] = state.agent_states.try_emplace(record.session_id, record);
  if (inserted) {
    return;
  }

  auto& existing         = it->second;
  existing.state_blob    = record.state_blob;
  existing.user_id       = record.user_id;
  existing.request_id    = record.request_id;
  existing.updated_at_ms = record.updated_at_ms;
}

Result MemoryRepository::UpsertAgentState(Transaction& t, const model::AgentStateRecord& r) {
  TX(t).Record([r](State& s) { ApplyUpsert(s, r); });
  return Result::Ok();
}

std::optional<model::AgentStateRecord> MemoryRepository::GetAgentState(Transaction& t, const std::string& session_id) {
  const auto& s  = TX(t).View();
  auto        it = s.agent_states.find(session_id);
  if (it == s.agent_states.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteAgentState(Transaction& t, const std::string& session_id) {
  if (!TX(t).View().agent_states.contains(session_id)) {
    return Result::Err(ErrorCode::NotFound);
  }
  TX(t).Record([session_id](State& s) { s.agent_states.erase(session_id); });
  return Result::Ok();
}

std::optional<uint64_t> MemoryRepository::CountLegacyCheckpoints(Transaction& t) {
  TX(t).LockLegacyCheckpoints();
  return TX(t).View().legacy_checkpoint_rows;
}

Result MemoryRepository::DropLegacyCheckpoints(Transaction& t) {
  TX(t).LockLegacyCheckpoints();
  TX(t).Record([](State& s) { s.legacy_checkpoint_rows.reset(); });
  return Result::Ok();
}

void MemoryRepository::SeedLegacyCheckpoints(uint64_t rows) {
  std::scoped_lock lock(mutex_);
  committed_.legacy_checkpoint_rows = rows;
}

} // namespace atelier::db::memory
