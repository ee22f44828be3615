#include "internal/state/agent_state_store.hpp"

#include <atomic>
#include <chrono>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

#if ATELIER_DB_SQLITE
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using atelier::db::ErrorCode;
using atelier::db::Result;
using atelier::db::Transaction;
using atelier::db::memory::MemoryRepository;
using atelier::db::model::AgentStateRecord;
using atelier::state::AgentStateStore;
using atelier::state::UpsertOptions;

/*
  Fails the first `failures` upserts with `code`, then delegates.
*/
class FlakyRepository final : public atelier::db::Repository {
 public:
  FlakyRepository(int failures, ErrorCode code) : failures_(failures), code_(code) {
  }

  std::unique_ptr<Transaction> Begin() override {
    return inner_.Begin();
  }

  Result UpsertAgentState(Transaction& tx, const AgentStateRecord& record) override {
    ++attempts_;
    if (failures_ > 0) {
      --failures_;
      return Result::Err(code_, "injected");
    }
    return inner_.UpsertAgentState(tx, record);
  }

  std::optional<AgentStateRecord> GetAgentState(Transaction& tx, const std::string& session_id) override {
    return inner_.GetAgentState(tx, session_id);
  }

  Result DeleteAgentState(Transaction& tx, const std::string& session_id) override {
    return inner_.DeleteAgentState(tx, session_id);
  }

  std::optional<uint64_t> CountLegacyCheckpoints(Transaction& tx) override {
    return inner_.CountLegacyCheckpoints(tx);
  }

  Result DropLegacyCheckpoints(Transaction& tx) override {
    return inner_.DropLegacyCheckpoints(tx);
  }

  int Attempts() const {
    return attempts_;
  }

 private:
  MemoryRepository inner_;
  int              failures_;
  ErrorCode        code_;
  int              attempts_ = 0;
};

void TestUpsertThenGet() {
  AgentStateStore store(std::make_shared<MemoryRepository>());

  store.Upsert("s1", "blob-1", UpsertOptions{.user_id = "u1", .request_id = "r1"});

  auto record = store.Get("s1");
  assert(record.has_value());
  assert(record->session_id == "s1");
  assert(record->state_blob == "blob-1");
  assert(record->user_id == "u1");
  assert(record->request_id == "r1");
  assert(record->created_at_ms > 0);
  assert(record->updated_at_ms >= record->created_at_ms);
}

void TestUpsertReplacesAndKeepsCreatedAt() {
  AgentStateStore store(std::make_shared<MemoryRepository>());

  store.Upsert("s1", "old");
  const auto first = store.Get("s1");
  assert(first.has_value());

  std::this_thread::sleep_for(std::chrono::milliseconds(2));
  store.Upsert("s1", "new");

  const auto second = store.Get("s1");
  assert(second.has_value());
  assert(second->state_blob == "new");
  assert(second->created_at_ms == first->created_at_ms);
  assert(second->updated_at_ms > first->updated_at_ms);
}

void TestGetMissingIsNotFound() {
  AgentStateStore store(std::make_shared<MemoryRepository>());
  assert(!store.Get("never-written").has_value());
}

void TestEmptySessionIdIsRejected() {
  AgentStateStore store(std::make_shared<MemoryRepository>());

  int rejected = 0;
  try {
    store.Upsert("", "x");
  } catch (const std::invalid_argument&) {
    ++rejected;
  }
  try {
    (void)store.Get("");
  } catch (const std::invalid_argument&) {
    ++rejected;
  }
  try {
    (void)store.Delete("");
  } catch (const std::invalid_argument&) {
    ++rejected;
  }
  assert(rejected == 3);
}

void TestDelete() {
  AgentStateStore store(std::make_shared<MemoryRepository>());

  store.Upsert("s1", "x");
  assert(store.Delete("s1"));
  assert(!store.Get("s1").has_value());
  assert(!store.Delete("s1"));
}

void TestSessionsAreIndependent() {
  AgentStateStore store(std::make_shared<MemoryRepository>());

  store.Upsert("a", "blob-a");
  store.Upsert("b", "blob-b");
  store.Upsert("a", "blob-a2");

  assert(store.Get("a")->state_blob == "blob-a2");
  assert(store.Get("b")->state_blob == "blob-b");
}

void TestConcurrentUpsertsOfOneSession() {
  AgentStateStore store(std::make_shared<MemoryRepository>());

  constexpr int            kWriters = 16;
  std::atomic<int>         failures{0};
  std::vector<std::thread> writers;
  for (int w = 0; w < kWriters; ++w) {
    writers.emplace_back([&store, &failures, w]() {
      for (int round = 0; round < 25; ++round) {
        try {
          store.Upsert("shared", "writer-" + std::to_string(w));
        } catch (const std::exception&) {
          ++failures;
        }
      }
    });
  }
  for (auto& writer : writers) {
    writer.join();
  }

  assert(failures.load() == 0);
  auto record = store.Get("shared");
  assert(record.has_value());
  assert(record->state_blob.rfind("writer-", 0) == 0);
}

void TestTransientFailuresAreRetried() {
  auto            repo = std::make_shared<FlakyRepository>(2, ErrorCode::Busy);
  AgentStateStore store(repo);

  store.Upsert("s1", "eventually");
  assert(repo->Attempts() == 3);
  assert(store.Get("s1")->state_blob == "eventually");
}

void TestExhaustedRetriesRaiseStorageError() {
  auto            repo = std::make_shared<FlakyRepository>(AgentStateStore::kMaxAttempts, ErrorCode::SerializationFailure);
  AgentStateStore store(repo);

  bool threw = false;
  try {
    store.Upsert("s1", "never");
  } catch (const atelier::util::StorageError&) {
    threw = true;
  }
  assert(threw);
  assert(repo->Attempts() == AgentStateStore::kMaxAttempts);
  assert(!store.Get("s1").has_value());
}

void TestPermanentFailureIsNotRetried() {
  auto            repo = std::make_shared<FlakyRepository>(1, ErrorCode::IOError);
  AgentStateStore store(repo);

  bool threw = false;
  try {
    store.Upsert("s1", "x");
  } catch (const atelier::util::StorageError&) {
    threw = true;
  }
  assert(threw);
  assert(repo->Attempts() == 1);
}

void TestLegacyMigrationIsIdempotent() {
  auto repo = std::make_shared<MemoryRepository>();
  repo->SeedLegacyCheckpoints(7);
  AgentStateStore store(repo);

  auto first = store.MigrateFromLegacyCheckpoints();
  assert(first.legacy_table_found);
  assert(first.rows_discarded == 7);

  auto second = store.MigrateFromLegacyCheckpoints();
  assert(!second.legacy_table_found);
  assert(second.rows_discarded == 0);
}

void TestConcurrentLegacyMigrationsCountOnce() {
  auto repo = std::make_shared<MemoryRepository>();
  repo->SeedLegacyCheckpoints(7);
  AgentStateStore store(repo);

  constexpr int                                  kOperators = 8;
  std::vector<atelier::state::MigrationResult>   results(kOperators);
  std::vector<std::thread>                       operators;
  for (int i = 0; i < kOperators; ++i) {
    operators.emplace_back([&store, &results, i]() { results[i] = store.MigrateFromLegacyCheckpoints(); });
  }
  for (auto& op : operators) {
    op.join();
  }

  int      found     = 0;
  uint64_t discarded = 0;
  for (const auto& result : results) {
    found += result.legacy_table_found ? 1 : 0;
    discarded += result.rows_discarded;
  }
  assert(found == 1);
  assert(discarded == 7);
}

void TestLegacyMigrationWithoutTable() {
  AgentStateStore store(std::make_shared<MemoryRepository>());
  store.Upsert("s1", "kept");

  auto result = store.MigrateFromLegacyCheckpoints();
  assert(!result.legacy_table_found);
  assert(result.rows_discarded == 0);
  assert(store.Get("s1").has_value());
}

#if ATELIER_DB_SQLITE
std::shared_ptr<atelier::db::Repository> OpenSqlite(const std::string& path, atelier::db::sqlite::SqliteOptions options = {}) {
  auto db = std::make_shared<atelier::db::sqlite::SqliteDB>(path, options);
  atelier::db::sql::RunMigrations(*db, atelier::db::sql::Dialect::kSqlite);
  return std::make_shared<atelier::db::sqlite::SqliteRepository>(std::move(db));
}

// Two handles on one file behave like two worker processes.
void TestSqliteConcurrentConnections() {
  const auto dir = std::filesystem::temp_directory_path() / "atelier_agent_state_store_tests";
  std::filesystem::remove_all(dir);
  const auto path = (dir / "state.db").string();

  AgentStateStore first(OpenSqlite(path));
  AgentStateStore second(OpenSqlite(path));

  std::atomic<int> failures{0};
  auto             writer = [&failures](AgentStateStore& store, const std::string& name) {
    for (int round = 0; round < 50; ++round) {
      try {
        store.Upsert("shared", name + "-" + std::to_string(round));
      } catch (const std::exception&) {
        ++failures;
      }
    }
  };

  std::thread a(writer, std::ref(first), "first");
  std::thread b(writer, std::ref(second), "second");
  a.join();
  b.join();

  assert(failures.load() == 0);
  auto record = first.Get("shared");
  assert(record.has_value());
  assert(record->state_blob == "first-49" || record->state_blob == "second-49");
}

// Writer lock held by another connection for longer than the busy timeout
// but shorter than the retry budget: the upsert waits it out.
void TestSqliteLockHeldElsewhereIsRetried() {
  const auto dir = std::filesystem::temp_directory_path() / "atelier_agent_state_store_busy_tests";
  std::filesystem::remove_all(dir);
  const auto path = (dir / "state.db").string();

  const atelier::db::sqlite::SqliteOptions short_timeout{.wal_mode = true, .busy_timeout_ms = 20};
  AgentStateStore                          store(OpenSqlite(path, short_timeout));

  atelier::db::sqlite::SqliteDB other(path, short_timeout);
  other.Exec("BEGIN IMMEDIATE;");

  std::thread holder([&other]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    other.Exec("COMMIT;");
  });

  bool threw = false;
  try {
    store.Upsert("contended", "after-lock");
  } catch (const atelier::util::StorageError&) {
    threw = true;
  }
  holder.join();

  assert(!threw);
  auto record = store.Get("contended");
  assert(record.has_value());
  assert(record->state_blob == "after-lock");
}
#endif

} // namespace

int main() {
  TestUpsertThenGet();
  TestUpsertReplacesAndKeepsCreatedAt();
  TestGetMissingIsNotFound();
  TestEmptySessionIdIsRejected();
  TestDelete();
  TestSessionsAreIndependent();
  TestConcurrentUpsertsOfOneSession();
  TestTransientFailuresAreRetried();
  TestExhaustedRetriesRaiseStorageError();
  TestPermanentFailureIsNotRetried();
  TestLegacyMigrationIsIdempotent();
  TestConcurrentLegacyMigrationsCountOnce();
  TestLegacyMigrationWithoutTable();
#if ATELIER_DB_SQLITE
  TestSqliteConcurrentConnections();
  TestSqliteLockHeldElsewhereIsRetried();
#endif

  std::cout << "atelier_unit_agent_state_store: pass\n";
  return 0;
}
