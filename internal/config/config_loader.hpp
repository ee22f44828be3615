#pragma once

#include <string>

#include "config/config.pb.h"
#include "internal/util/env.hpp"

namespace atelier::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Environment overrides (DATABASE_URL) are applied on top by Load().
*/
class ConfigLoader {
 public:
  static atelier::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Empty path means "no file": defaults plus environment.
  static atelier::runtime::config::RuntimeConfig Load(const std::string& path, const util::EnvLookup& env);

  static void ApplyEnvironment(atelier::runtime::config::RuntimeConfig& config, const util::EnvLookup& env);

  /*
    Accepted forms:
      sqlite:///relative/path.db      sqlite:////absolute/path.db
      sqlite+aiosqlite:///...         postgresql://...
      postgres://...                  postgresql+<driver>://...
  */
  static void ApplyDatabaseUrl(atelier::runtime::config::RuntimeConfig& config, const std::string& url);
};

} // namespace atelier::config
