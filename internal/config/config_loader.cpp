#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace feedstore::config {

using feedstore::runtime::config::RuntimeConfig;

namespace {

constexpr const char* kDefaultDbPath = "channels.db";

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

// YAML scalars carry no type; quoted strings keep their tag "!".
void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

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

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
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

} // namespace

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

  RuntimeConfig config;

  // an empty file is an empty document, not an error
  if (!yaml.IsNull()) {
    if (!yaml.IsMap()) {
      throw std::runtime_error("Invalid configuration: top level must be a mapping");
    }

    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  if (!config.has_database()) {
    *config.mutable_database() = Defaults().database();
  }

  ApplyEnvironment(config);
  Validate(config);
  return config;
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  config.mutable_database()->mutable_sqlite()->set_path(kDefaultDbPath);
  config.mutable_logging()->set_level("info");
  return config;
}

void ConfigLoader::ApplyEnvironment(RuntimeConfig& config) {
  if (const char* db_path = std::getenv("FEEDSTORE_DB_PATH"); db_path && *db_path) {
    config.mutable_database()->mutable_sqlite()->set_path(db_path);
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& database = config.database();
  switch (database.backend_case()) {
    case feedstore::runtime::config::DatabaseConfig::kSqlite:
      if (database.sqlite().path().empty()) {
        throw std::runtime_error("Invalid configuration: database.sqlite.path must not be empty");
      }
      // sqlite3_busy_timeout takes an int
      if (database.sqlite().busy_timeout_ms() > static_cast<uint32_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error("Invalid configuration: database.sqlite.busy_timeout_ms is out of range");
      }
      break;
    case feedstore::runtime::config::DatabaseConfig::kMemory:
      break;
    case feedstore::runtime::config::DatabaseConfig::BACKEND_NOT_SET:
      throw std::runtime_error("Invalid configuration: database must name a backend (sqlite or memory)");
  }
}

} // namespace feedstore::config
