#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace atelier::model {

// Every embedding handled by this project has exactly this many elements.
inline constexpr std::size_t kEmbeddingDimension = 768;

inline constexpr const char* kBeautyStandardEmbeddingKey = "beauty_standard_embedding";

using Embedding = std::vector<double>;

// Request-scoped overrides, checked before any other source.
using RuntimeOverrides = std::unordered_map<std::string, Embedding>;

/*
  Tier that supplied a resolved value.
  Diagnostic only: a Placeholder value is still a valid value.
*/
enum class ValueSource {
  kRuntimeConfig,
  kEnvironment,
  kFile,
  kPlaceholder,
};

inline const char* ToString(ValueSource source) {
  switch (source) {
    case ValueSource::kRuntimeConfig:
      return "runtime_config";
    case ValueSource::kEnvironment:
      return "environment";
    case ValueSource::kFile:
      return "file";
    case ValueSource::kPlaceholder:
      return "placeholder";
  }
  return "unknown";
}

struct ConfigValue {
  std::string key;
  Embedding   vector;
  ValueSource source = ValueSource::kPlaceholder;
};

} // namespace atelier::model
