#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace tracebrain::config {

namespace {

using tracebrain::runtime::config::RuntimeConfig;

constexpr uint32_t kDefaultQueryLimit      = 20;
constexpr uint32_t kDefaultMaxQueryLimit   = 100;
constexpr uint32_t kDefaultCommitRetries   = 5;
constexpr uint32_t kDefaultProviderRetries = 2;
constexpr int64_t  kDefaultProviderTimeoutSeconds = 60;
constexpr int64_t  kDefaultRpcDeadlineSeconds     = 30;
constexpr char     kDefaultBindAddress[]          = "0.0.0.0:50051";

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings ("30s", "0.0.0.0:50051", "123")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = std::strtod(scalar_value.c_str(), &endptr);
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
      for (const auto& item : node) {
        YamlToProtoValue(item, list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (const auto& it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
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

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  Normalize(&config);
  return config;
}

void ConfigLoader::Normalize(RuntimeConfig* config) {
  auto* server = config->mutable_server();
  if (server->bind_address().empty()) {
    server->set_bind_address(kDefaultBindAddress);
  }
  if (!server->has_default_deadline()) {
    server->mutable_default_deadline()->set_seconds(kDefaultRpcDeadlineSeconds);
  }

  auto* query = config->mutable_query();
  if (query->default_limit() == 0) {
    query->set_default_limit(kDefaultQueryLimit);
  }
  if (query->max_limit() == 0) {
    query->set_max_limit(kDefaultMaxQueryLimit);
  }
  if (query->default_limit() > query->max_limit()) {
    throw std::runtime_error("Invalid configuration: query.default_limit exceeds query.max_limit");
  }

  auto* ingestion = config->mutable_ingestion();
  if (ingestion->max_commit_retries() == 0) {
    ingestion->set_max_commit_retries(kDefaultCommitRetries);
  }

  auto* llm = config->mutable_llm();
  if (llm->max_retries() == 0) {
    llm->set_max_retries(kDefaultProviderRetries);
  }
  if (!llm->has_timeout()) {
    llm->mutable_timeout()->set_seconds(kDefaultProviderTimeoutSeconds);
  }
  if (llm->temperature() < 0.0 || llm->temperature() > 2.0) {
    throw std::runtime_error("Invalid configuration: llm.temperature must be within [0, 2]");
  }

  if (config->database().has_sqlite() && config->database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (config->database().has_postgres() && config->database().postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }
}

} // namespace tracebrain::config
