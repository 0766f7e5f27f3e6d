#pragma once

#include <optional>
#include <string>

#include <google/protobuf/struct.pb.h>

namespace tracebrain::llm {

// Parses a model reply that should be a single JSON object. A fenced code
// block around the object is unwrapped; nothing else is tolerated.
std::optional<google::protobuf::Struct> ParseJsonReply(const std::string& reply);

} // namespace tracebrain::llm
