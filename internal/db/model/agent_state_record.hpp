#pragma once

#include <cstdint>
#include <string>

namespace atelier::db::model {

/*
  Latest agent state for one conversation.

  state_blob is opaque to this layer:
    postgres -> bytea
    sqlite   -> blob
    memory   -> string
*/

struct AgentStateRecord {
  std::string session_id;

  // serialized orchestration state, may contain NUL bytes
  std::string state_blob;

  // empty means unset (stored as NULL)
  std::string user_id;
  std::string request_id;

  // epoch ms
  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace atelier::db::model
