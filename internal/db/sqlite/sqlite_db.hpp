#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace atelier::db::sqlite {

struct SqliteOptions {
  bool     wal_mode        = true;
  unsigned busy_timeout_ms = 5000;
};

/*
  Thin RAII wrapper around sqlite3*.

  One handle carries one transaction at a time: SqliteTransaction holds
  TxMutex() for its lifetime. Other processes sharing the file are
  serialized by SQLite's own file locks (BEGIN IMMEDIATE + busy timeout).
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  // Configure PRAGMAs (WAL, foreign keys, busy timeout)
  void Configure();

 private:
  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
  std::mutex    tx_mutex_;
};

} // namespace atelier::db::sqlite
