#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace atelier::config {

using atelier::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("5000" must not become a number)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static bool StartsWith(const std::string& value, const std::string& prefix) {
  return value.compare(0, prefix.size(), prefix) == 0;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  // an empty document is a valid, all-defaults config
  if (yaml.IsNull()) {
    return RuntimeConfig{};
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

RuntimeConfig ConfigLoader::Load(const std::string& path, const util::EnvLookup& env) {
  RuntimeConfig config = path.empty() ? RuntimeConfig{} : LoadFromYaml(path);
  ApplyEnvironment(config, env);
  return config;
}

void ConfigLoader::ApplyEnvironment(RuntimeConfig& config, const util::EnvLookup& env) {
  if (auto url = env("DATABASE_URL")) {
    ApplyDatabaseUrl(config, *url);
  }
}

void ConfigLoader::ApplyDatabaseUrl(RuntimeConfig& config, const std::string& url) {
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos) {
    throw std::runtime_error("Invalid DATABASE_URL: missing scheme");
  }

  // drop driver suffixes such as +asyncpg / +aiosqlite
  std::string scheme = url.substr(0, scheme_end);
  if (auto plus = scheme.find('+'); plus != std::string::npos) {
    scheme.resize(plus);
  }
  const std::string rest = url.substr(scheme_end + 3);

  auto* database = config.mutable_database();

  if (scheme == "sqlite") {
    // sqlite:///relative.db -> "relative.db", sqlite:////abs.db -> "/abs.db"
    if (!StartsWith(rest, "/") || rest.size() < 2) {
      throw std::runtime_error("Invalid DATABASE_URL: sqlite URL needs a path");
    }
    auto* sqlite = database->mutable_sqlite();
    sqlite->set_path(rest.substr(1));
    return;
  }

  if (scheme == "postgresql" || scheme == "postgres") {
    database->mutable_postgres()->set_connection_uri("postgresql://" + rest);
    return;
  }

  throw std::runtime_error("Invalid DATABASE_URL: unsupported scheme '" + scheme + "'");
}

} // namespace atelier::config
