#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace migrator::config {

namespace {

constexpr uint64_t    kDefaultChunkBytes  = 8ull * 1024 * 1024;
constexpr uint32_t    kDefaultMaxAttempts = 3;
constexpr uint64_t    kDefaultBaseDelayMs = 2000;
constexpr double      kDefaultMultiplier  = 2.0;
constexpr uint64_t    kDefaultMaxDelayMs  = 60000;
constexpr double      kDefaultJitterRatio = 0.2;
constexpr const char* kDefaultStoreUri    = "s3://";

[[noreturn]] void Reject(const std::string& reason) {
  throw std::runtime_error("Invalid configuration: " + reason);
}

void ValidateCredentials(const migrator::runtime::config::S3Options& s3, const std::string& side) {
  const bool has_access = !s3.access_key().empty();
  const bool has_secret = !s3.secret_key().empty();
  if (has_access != has_secret) Reject(side + ".store.s3.access_key and secret_key must be set together");
  if (!has_access && !s3.session_token().empty()) Reject(side + ".store.s3.session_token requires access_key");
  if (has_access && s3.anonymous()) Reject(side + ".store.s3.anonymous cannot be combined with access_key");
}

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("007" as a container name)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
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

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

migrator::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  migrator::runtime::config::RuntimeConfig config;
  if (yaml.IsNull()) {
    return config;
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

  return config;
}

void ConfigLoader::ApplyOverrides(migrator::runtime::config::RuntimeConfig& config, const CommandLineOverrides& overrides) {
  if (overrides.source_container) config.mutable_source()->set_container(*overrides.source_container);
  if (overrides.destination_bucket) config.mutable_destination()->set_bucket(*overrides.destination_bucket);
  if (overrides.region) config.mutable_destination()->set_region(*overrides.region);
  if (overrides.source_uri) config.mutable_source()->mutable_store()->set_uri(*overrides.source_uri);
  if (overrides.destination_uri) config.mutable_destination()->mutable_store()->set_uri(*overrides.destination_uri);
  if (overrides.max_workers) config.mutable_transfer()->set_max_workers(*overrides.max_workers);
  if (overrides.bandwidth_limit_mb) config.mutable_transfer()->set_bandwidth_limit_mb(*overrides.bandwidth_limit_mb);
}

void ConfigLoader::Validate(migrator::runtime::config::RuntimeConfig& config) {
  // ------------------------------------------------------------
  // Required
  // ------------------------------------------------------------
  if (config.source().container().empty()) Reject("source.container is required");
  if (config.destination().bucket().empty()) Reject("destination.bucket is required");
  if (config.transfer().max_workers() < 1) Reject("transfer.max_workers must be at least 1");
  if (config.transfer().bandwidth_limit_mb() < 1) Reject("transfer.bandwidth_limit_mb must be at least 1");

  // ------------------------------------------------------------
  // Stores
  // ------------------------------------------------------------
  if (config.source().store().uri().empty()) config.mutable_source()->mutable_store()->set_uri(kDefaultStoreUri);
  if (config.destination().store().uri().empty()) config.mutable_destination()->mutable_store()->set_uri(kDefaultStoreUri);
  ValidateCredentials(config.source().store().s3(), "source");
  ValidateCredentials(config.destination().store().s3(), "destination");

  // ------------------------------------------------------------
  // Transfer / retry
  // ------------------------------------------------------------
  auto* transfer = config.mutable_transfer();
  if (transfer->chunk_bytes() == 0) transfer->set_chunk_bytes(kDefaultChunkBytes);

  auto* retry = config.mutable_retry();
  if (retry->max_attempts() == 0) retry->set_max_attempts(kDefaultMaxAttempts);
  if (retry->base_delay_ms() == 0) retry->set_base_delay_ms(kDefaultBaseDelayMs);
  if (retry->multiplier() == 0) retry->set_multiplier(kDefaultMultiplier);
  if (retry->max_delay_ms() == 0) retry->set_max_delay_ms(kDefaultMaxDelayMs);
  if (!retry->has_jitter_ratio()) retry->set_jitter_ratio(kDefaultJitterRatio);

  if (retry->multiplier() < 1.0) Reject("retry.multiplier must be at least 1");
  if (retry->jitter_ratio() < 0 || retry->jitter_ratio() > 1.0) Reject("retry.jitter_ratio must be within [0, 1]");
  if (retry->max_delay_ms() < retry->base_delay_ms()) Reject("retry.max_delay_ms must not be below retry.base_delay_ms");

  // ------------------------------------------------------------
  // Staging / logging
  // ------------------------------------------------------------
  if (config.staging().directory().empty()) {
    const auto directory = std::filesystem::temp_directory_path() / config.destination().bucket();
    config.mutable_staging()->set_directory(directory.string());
  }

  auto* logging = config.mutable_logging();
  if (logging->directory().empty()) logging->set_directory(".");
  if (!logging->has_file_enabled()) logging->set_file_enabled(true);
}

} // namespace migrator::config
