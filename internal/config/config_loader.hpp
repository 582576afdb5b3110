#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "config/config.pb.h"

namespace migrator::config {

/*
  Values given on the command line; each one set replaces the matching
  config field.
*/
struct CommandLineOverrides {
  std::optional<std::string> source_container;
  std::optional<std::string> destination_bucket;
  std::optional<std::string> region;
  std::optional<std::string> source_uri;
  std::optional<std::string> destination_uri;
  std::optional<uint32_t>    max_workers;
  std::optional<uint32_t>    bandwidth_limit_mb;
};

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected.
*/
class ConfigLoader {
 public:
  static migrator::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyOverrides(migrator::runtime::config::RuntimeConfig& config, const CommandLineOverrides& overrides);

  /*
    Fills defaults in place and rejects unusable values.

    Throws std::runtime_error("Invalid configuration: ...").
  */
  static void Validate(migrator::runtime::config::RuntimeConfig& config);
};

} // namespace migrator::config
