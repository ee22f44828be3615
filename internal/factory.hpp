#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/config/config_resolver.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/state/agent_state_store.hpp"
#include "internal/util/env.hpp"

namespace atelier::factory {

/*
  Runtime

  Owns the long-lived components handed to callers.
*/
struct Runtime {
  std::shared_ptr<db::Repository>         repository;
  std::shared_ptr<config::ConfigResolver> resolver;
  std::shared_ptr<state::AgentStateStore> state_store;
};

/*
  Composition root. The ONLY place allowed to know concrete DB types.

  database.sqlite   -> SqliteRepository (migrations applied)
  database.postgres -> PgRepository     (migrations applied)
  unset             -> MemoryRepository
*/
std::shared_ptr<db::Repository> BuildRepository(const atelier::runtime::config::RuntimeConfig& config);

std::shared_ptr<config::ConfigResolver> BuildResolver(const atelier::runtime::config::RuntimeConfig& config,
                                                      util::EnvLookup                               env = util::ProcessEnvironment());

Runtime Build(const atelier::runtime::config::RuntimeConfig& config, util::EnvLookup env = util::ProcessEnvironment());

} // namespace atelier::factory
