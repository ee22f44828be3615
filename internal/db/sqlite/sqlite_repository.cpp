#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace atelier::db::sqlite {

using atelier::db::ErrorCode;
using atelier::db::Result;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StmtPtr Prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        sqlite3_finalize(st);
        return StmtPtr(nullptr, &sqlite3_finalize);
    }
    return StmtPtr(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

// empty string -> NULL
void BindOptionalText(sqlite3_stmt* st, int idx, const std::string& s) {
    if (s.empty()) {
        sqlite3_bind_null(st, idx);
        return;
    }
    BindText(st, idx, s);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& bytes) {
    // a null data pointer would bind SQL NULL
    if (bytes.empty()) {
        sqlite3_bind_zeroblob(st, idx, 0);
        return;
    }
    sqlite3_bind_blob(st, idx, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? std::string(reinterpret_cast<const char*>(t), static_cast<size_t>(sqlite3_column_bytes(st, col))) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
    const void* data = sqlite3_column_blob(st, col);
    const int   size = sqlite3_column_bytes(st, col);
    return data ? std::string(static_cast<const char*>(data), static_cast<size_t>(size)) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

[[noreturn]] void ThrowRead(sqlite3* db, const char* what) {
    throw util::StorageError(std::string("sqlite ") + what + ": " + sqlite3_errmsg(db));
}

uint64_t QueryCount(sqlite3* db, const char* sql) {
    auto st = Prepare(db, sql);
    if (!st) ThrowRead(db, "prepare");

    if (sqlite3_step(st.get()) != SQLITE_ROW) ThrowRead(db, "count");
    return ColU64(st.get(), 0);
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_CANTOPEN:
        case SQLITE_READONLY:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Agent state
// ------------------------------------------------------------------

Result SqliteRepository::UpsertAgentState(Transaction& t, const model::AgentStateRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::UPSERT_AGENT_STATE);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.session_id);
    BindOptionalText(st.get(), 2, r.user_id);
    BindOptionalText(st.get(), 3, r.request_id);
    BindBlob(st.get(), 4, r.state_blob);
    BindU64(st.get(), 5, r.created_at_ms);
    BindU64(st.get(), 6, r.updated_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::AgentStateRecord>
SqliteRepository::GetAgentState(Transaction& t, const std::string& session_id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::SELECT_AGENT_STATE);
    if (!st) ThrowRead(db, "prepare");

    BindText(st.get(), 1, session_id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) ThrowRead(db, "read agent_state");

    model::AgentStateRecord r;
    r.session_id    = ColText(st.get(), 0);
    r.user_id       = ColText(st.get(), 1);
    r.request_id    = ColText(st.get(), 2);
    r.state_blob    = ColBlob(st.get(), 3);
    r.created_at_ms = ColU64(st.get(), 4);
    r.updated_at_ms = ColU64(st.get(), 5);
    return r;
}

Result SqliteRepository::DeleteAgentState(Transaction& t, const std::string& session_id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::DELETE_AGENT_STATE);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, session_id);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result && sqlite3_changes(db) == 0) {
        return Result::Err(ErrorCode::NotFound);
    }
    return result;
}

// ------------------------------------------------------------------
// Legacy checkpoints
// ------------------------------------------------------------------

std::optional<uint64_t> SqliteRepository::CountLegacyCheckpoints(Transaction& t) {
    auto* db = TX(t).Handle();

    if (QueryCount(db, sql::LEGACY_CHECKPOINTS_EXISTS) == 0) {
        return std::nullopt;
    }
    return QueryCount(db, sql::COUNT_LEGACY_CHECKPOINTS);
}

Result SqliteRepository::DropLegacyCheckpoints(Transaction& t) {
    auto* db = TX(t).Handle();

    char* err = nullptr;
    int   rc  = sqlite3_exec(db, sql::DROP_LEGACY_CHECKPOINTS, nullptr, nullptr, &err);
    sqlite3_free(err);
    return Translate(db, rc);
}

}
