#pragma once

#include <string>

#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>

namespace tracebrain::util {

/*
  JSON helpers on top of protobuf's JSON mapping. Attribute bags are
  google.protobuf.Struct so they round-trip arbitrary JSON objects.
*/

std::string StructToJson(const google::protobuf::Struct& value);

// Throws ValidationError when the text is not a JSON object.
google::protobuf::Struct JsonToStruct(const std::string& json);

std::string MessageToJson(const google::protobuf::Message& message);

// Throws std::runtime_error with the parser message on failure.
void JsonToMessage(const std::string& json, google::protobuf::Message* message, bool ignore_unknown_fields);

// Plain text form of a value: strings unquoted, everything else as JSON.
std::string ValueToText(const google::protobuf::Value& value);

} // namespace tracebrain::util
