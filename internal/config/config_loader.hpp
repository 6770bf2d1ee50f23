#pragma once

#include <string>

#include "config/config.pb.h"

namespace feedstore::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf, so unknown keys and
  mistyped values are rejected by the protobuf JSON parser.

  After parsing, FEEDSTORE_DB_PATH (if set) replaces the sqlite path and the
  result is validated. All failures throw std::runtime_error.
*/
class ConfigLoader {
 public:
  static feedstore::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // sqlite store at ./channels.db, info logging
  static feedstore::runtime::config::RuntimeConfig Defaults();

  static void ApplyEnvironment(feedstore::runtime::config::RuntimeConfig& config);

  static void Validate(const feedstore::runtime::config::RuntimeConfig& config);
};

} // namespace feedstore::config
