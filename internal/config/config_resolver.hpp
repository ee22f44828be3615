#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/embedding.hpp"
#include "internal/util/env.hpp"

namespace atelier::config {

struct ResolverOptions {
  // Home of <key>.arrow when <KEY>_PATH is unset.
  std::string data_dir = "data";
};

/*
  ConfigResolver

  Resolves a named embedding through an ordered chain of tiers:

    1. runtime overrides       (per call)
    2. environment variable    <KEY>          (see embedding_codec.hpp)
    3. array file              $<KEY>_PATH or <data_dir>/<key>.arrow
    4. placeholder             768 zeros

  The first tier yielding a vector of the right length wins. A malformed
  source is logged and skipped; Resolve() always returns a usable value,
  so a misconfiguration only shows up in ConfigValue::source.

  Resolve() is const and keeps no state: safe to call from any thread.
*/
class ConfigResolver {
 public:
  using Lookup =
      std::function<std::optional<model::Embedding>(const std::string& key, const model::RuntimeOverrides& overrides)>;

  struct Tier {
    model::ValueSource source;
    Lookup             lookup;
  };

  explicit ConfigResolver(ResolverOptions options = {}, util::EnvLookup env = util::ProcessEnvironment());

  // tiers capture this
  ConfigResolver(const ConfigResolver&)            = delete;
  ConfigResolver& operator=(const ConfigResolver&) = delete;

  // Throws std::invalid_argument on an empty key, nothing else.
  model::ConfigValue Resolve(const std::string& key, const model::RuntimeOverrides& overrides = {}) const;

  /*
    Write vector to the file tier of the beauty standard embedding, or to
    an explicit path. Overwrites atomically (tmp + rename).
    Throws util::StorageError on a wrong length, a non-finite element or an
    unwritable target.
    Do not persist the same path from two callers at once.
  */
  void Persist(const model::Embedding& vector) const;
  void Persist(const model::Embedding& vector, const std::filesystem::path& path) const;

  std::filesystem::path FilePathFor(const std::string& key) const;

  // beauty_standard_embedding -> BEAUTY_STANDARD_EMBEDDING
  static std::string EnvVarFor(const std::string& key);
  static std::string PathEnvVarFor(const std::string& key);

 private:
  std::optional<model::Embedding> FromOverrides(const std::string& key, const model::RuntimeOverrides& overrides) const;
  std::optional<model::Embedding> FromEnvironment(const std::string& key) const;
  std::optional<model::Embedding> FromFile(const std::string& key) const;

  ResolverOptions   options_;
  util::EnvLookup   env_;
  std::vector<Tier> tiers_;
};

} // namespace atelier::config
