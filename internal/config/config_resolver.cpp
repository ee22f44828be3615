#include "config_resolver.hpp"

#include <cctype>
#include <stdexcept>

#include "internal/config/embedding_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/embedding_file.hpp"
#include "internal/util/errors.hpp"

namespace atelier::config {

using model::ConfigValue;
using model::Embedding;
using model::kEmbeddingDimension;
using model::RuntimeOverrides;
using model::ValueSource;
using observability::IntField;
using observability::StringField;

ConfigResolver::ConfigResolver(ResolverOptions options, util::EnvLookup env) : options_(std::move(options)), env_(std::move(env)) {
  tiers_.push_back({ValueSource::kRuntimeConfig,
                    [this](const std::string& key, const RuntimeOverrides& overrides) { return FromOverrides(key, overrides); }});
  tiers_.push_back({ValueSource::kEnvironment, [this](const std::string& key, const RuntimeOverrides&) { return FromEnvironment(key); }});
  tiers_.push_back({ValueSource::kFile, [this](const std::string& key, const RuntimeOverrides&) { return FromFile(key); }});
}

std::string ConfigResolver::EnvVarFor(const std::string& key) {
  std::string name;
  name.reserve(key.size());
  for (unsigned char c : key) {
    name.push_back(std::isalnum(c) ? static_cast<char>(std::toupper(c)) : '_');
  }
  return name;
}

std::string ConfigResolver::PathEnvVarFor(const std::string& key) {
  return EnvVarFor(key) + "_PATH";
}

std::filesystem::path ConfigResolver::FilePathFor(const std::string& key) const {
  if (auto path = env_(PathEnvVarFor(key))) {
    return *path;
  }
  return std::filesystem::path(options_.data_dir) / (key + ".arrow");
}

ConfigValue ConfigResolver::Resolve(const std::string& key, const RuntimeOverrides& overrides) const {
  if (key.empty()) {
    throw std::invalid_argument("configuration key must not be empty");
  }

  for (const auto& tier : tiers_) {
    std::optional<Embedding> vector;
    try {
      vector = tier.lookup(key, overrides);
    } catch (const util::MalformedSource& e) {
      ATELIER_LOG_WARN("skipping malformed configuration source",
                       {StringField("key", key), StringField("source", model::ToString(tier.source)), StringField("error", e.what())});
      continue;
    }

    if (vector) {
      ATELIER_LOG_DEBUG("configuration value resolved", {StringField("key", key), StringField("source", model::ToString(tier.source))});
      return ConfigValue{key, std::move(*vector), tier.source};
    }
  }

  ATELIER_LOG_WARN("using placeholder zero vector",
                   {StringField("key", key), StringField("env", EnvVarFor(key)), StringField("path_env", PathEnvVarFor(key))});
  return ConfigValue{key, Embedding(kEmbeddingDimension, 0.0), ValueSource::kPlaceholder};
}

std::optional<Embedding> ConfigResolver::FromOverrides(const std::string& key, const RuntimeOverrides& overrides) const {
  auto it = overrides.find(key);
  if (it == overrides.end()) {
    return std::nullopt;
  }
  if (it->second.size() != kEmbeddingDimension) {
    throw util::MalformedSource("runtime override has " + std::to_string(it->second.size()) + " elements");
  }
  return it->second;
}

std::optional<Embedding> ConfigResolver::FromEnvironment(const std::string& key) const {
  const auto name  = EnvVarFor(key);
  auto       value = env_(name);
  if (!value) {
    return std::nullopt;
  }

  try {
    return ParseEmbeddingText(*value);
  } catch (const util::MalformedSource& e) {
    throw util::MalformedSource(name + ": " + e.what());
  }
}

std::optional<Embedding> ConfigResolver::FromFile(const std::string& key) const {
  const auto path   = FilePathFor(key);
  auto       vector = storage::ReadEmbeddingFile(path);
  if (!vector) {
    ATELIER_LOG_DEBUG("no embedding file", {StringField("key", key), StringField("path", path.string())});
  }
  return vector;
}

void ConfigResolver::Persist(const Embedding& vector) const {
  Persist(vector, FilePathFor(model::kBeautyStandardEmbeddingKey));
}

void ConfigResolver::Persist(const Embedding& vector, const std::filesystem::path& path) const {
  storage::WriteEmbeddingFile(path, vector);
  ATELIER_LOG_INFO("embedding persisted", {StringField("path", path.string()), IntField("elements", static_cast<int64_t>(vector.size()))});
}

} // namespace atelier::config
