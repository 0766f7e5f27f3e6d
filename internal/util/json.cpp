#include "json.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace tracebrain::util {

std::string StructToJson(const google::protobuf::Struct& value) {
  return MessageToJson(value);
}

google::protobuf::Struct JsonToStruct(const std::string& json) {
  google::protobuf::Struct out;
  if (json.empty()) {
    return out;
  }
  try {
    JsonToMessage(json, &out, false);
  } catch (const std::runtime_error& e) {
    throw ValidationError(std::string("attributes are not a JSON object: ") + e.what());
  }
  return out;
}

std::string MessageToJson(const google::protobuf::Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize message to JSON: " + std::string(status.message()));
  }
  return json;
}

void JsonToMessage(const std::string& json, google::protobuf::Message* message, bool ignore_unknown_fields) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = ignore_unknown_fields;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw std::runtime_error(std::string(status.message()));
  }
}

std::string ValueToText(const google::protobuf::Value& value) {
  if (value.kind_case() == google::protobuf::Value::kStringValue) {
    return value.string_value();
  }
  return MessageToJson(value);
}

} // namespace tracebrain::util
