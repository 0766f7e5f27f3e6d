#include "json_reply.hpp"

#include <string_view>

#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace tracebrain::llm {

namespace {

std::string_view Trim(std::string_view text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

} // namespace

std::optional<google::protobuf::Struct> ParseJsonReply(const std::string& reply) {
  auto text = Trim(reply);

  // ```json\n{...}\n```
  if (text.starts_with("```")) {
    const auto body_start = text.find('\n');
    const auto body_end   = text.rfind("```");
    if (body_start == std::string_view::npos || body_end <= body_start) {
      return std::nullopt;
    }
    text = Trim(text.substr(body_start + 1, body_end - body_start - 1));
  }
  if (text.empty() || text.front() != '{') {
    return std::nullopt;
  }

  try {
    return util::JsonToStruct(std::string(text));
  } catch (const util::ValidationError&) {
    return std::nullopt;
  }
}

} // namespace tracebrain::llm
