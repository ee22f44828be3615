#include "pg_pool.hpp"

#include "internal/db/sql/migrations.hpp"

namespace atelier::db::postgres {

namespace {

class WorkExecutor final : public sql::MigrationExecutor {
 public:
  explicit WorkExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        // drop connections the server closed while they sat idle
        if (!conn->is_open()) {
          --live_connections_;
          continue;
        }
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("upsert_agent_state",
               "INSERT INTO agent_state(session_id,user_id,request_id,state_blob,created_at_ms,updated_at_ms) "
               "VALUES($1,NULLIF($2,''),NULLIF($3,''),$4,$5,$6) "
               "ON CONFLICT(session_id) DO UPDATE SET "
               "user_id=EXCLUDED.user_id,request_id=EXCLUDED.request_id,"
               "state_blob=EXCLUDED.state_blob,updated_at_ms=EXCLUDED.updated_at_ms");

  conn.prepare("get_agent_state",
               "SELECT session_id,user_id,request_id,state_blob,created_at_ms,updated_at_ms "
               "FROM agent_state WHERE session_id=$1");

  conn.prepare("delete_agent_state", "DELETE FROM agent_state WHERE session_id=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

void ApplySchema(PgPool& pool) {
  auto         conn = pool.Acquire();
  pqxx::work   tx(*conn);
  WorkExecutor executor(tx);
  sql::RunMigrations(executor, sql::Dialect::kPostgres);
  tx.commit();
}

} // namespace atelier::db::postgres
