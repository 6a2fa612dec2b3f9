#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace relay::config {

namespace {

constexpr int64_t  kDefaultAccessTokenTtlSec  = 60 * 60;
constexpr int64_t  kDefaultRefreshTokenTtlSec = 7 * 24 * 60 * 60;
constexpr int64_t  kDefaultPairingCodeTtlSec  = 10 * 60;
constexpr int64_t  kDefaultCommandTtlSec      = 24 * 60 * 60;
constexpr int64_t  kDefaultSweepIntervalSec   = 30;
constexpr uint32_t kDefaultBufferFrames       = 8;
constexpr uint32_t kDefaultMalformedPerMinute = 20;
constexpr uint32_t kDefaultPbkdf2Iterations   = 100000;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  // quoted scalars stay strings ("600s", "0123")
  if (node.Tag() == "!") {
    value->set_string_value(node.Scalar());
    return;
  }

  const std::string& scalar_value = node.Scalar();
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

void DefaultDuration(google::protobuf::Duration* d, int64_t seconds) {
  if (d->seconds() == 0 && d->nanos() == 0) {
    d->set_seconds(seconds);
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

relay::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  relay::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  if (const char* secret = std::getenv("RELAY_SECRET_KEY")) {
    config.mutable_auth()->set_secret_key(secret);
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(relay::runtime::config::RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) {
    server->set_bind_address("0.0.0.0:50051");
  }
  if (server->max_malformed_per_minute() == 0) {
    server->set_max_malformed_per_minute(kDefaultMalformedPerMinute);
  }

  auto* auth = config.mutable_auth();
  DefaultDuration(auth->mutable_access_token_ttl(), kDefaultAccessTokenTtlSec);
  DefaultDuration(auth->mutable_refresh_token_ttl(), kDefaultRefreshTokenTtlSec);
  DefaultDuration(auth->mutable_pairing_code_ttl(), kDefaultPairingCodeTtlSec);
  if (auth->pbkdf2_iterations() == 0) {
    auth->set_pbkdf2_iterations(kDefaultPbkdf2Iterations);
  }

  auto* queue = config.mutable_queue();
  DefaultDuration(queue->mutable_command_ttl(), kDefaultCommandTtlSec);
  DefaultDuration(queue->mutable_sweep_interval(), kDefaultSweepIntervalSec);

  if (config.media().buffer_frames() == 0) {
    config.mutable_media()->set_buffer_frames(kDefaultBufferFrames);
  }
}

void ConfigLoader::Validate(const relay::runtime::config::RuntimeConfig& config) {
  if (config.auth().secret_key().empty()) {
    throw std::runtime_error("Invalid configuration: auth.secret_key is required (or set RELAY_SECRET_KEY)");
  }
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }
}

} // namespace relay::config
