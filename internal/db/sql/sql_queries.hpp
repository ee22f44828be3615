#pragma once

namespace atelier::db::sql {

/*
  SQLite statements.

  Postgres installs the same statements with $n placeholders as
  prepared statements per connection (see PgPool).
*/

static constexpr const char* UPSERT_AGENT_STATE =
    "INSERT INTO agent_state(session_id,user_id,request_id,state_blob,created_at_ms,updated_at_ms)"
    " VALUES(?,?,?,?,?,?)"
    " ON CONFLICT(session_id) DO UPDATE SET"
    " user_id=excluded.user_id,"
    " request_id=excluded.request_id,"
    " state_blob=excluded.state_blob,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SELECT_AGENT_STATE =
    "SELECT session_id,user_id,request_id,state_blob,created_at_ms,updated_at_ms"
    " FROM agent_state WHERE session_id=?;";

static constexpr const char* DELETE_AGENT_STATE =
    "DELETE FROM agent_state WHERE session_id=?;";

// legacy checkpoints

static constexpr const char* LEGACY_CHECKPOINTS_EXISTS =
    "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name='checkpoints';";

static constexpr const char* COUNT_LEGACY_CHECKPOINTS =
    "SELECT COUNT(*) FROM checkpoints;";

static constexpr const char* DROP_LEGACY_CHECKPOINTS =
    "DROP TABLE IF EXISTS checkpoints;";

}
