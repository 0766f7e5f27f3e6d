#include "query_translator.hpp"

#include <google/protobuf/util/time_util.h>

#include <array>
#include <cmath>
#include <initializer_list>
#include <string_view>

#include "internal/core/trace_filter.hpp"
#include "internal/llm/json_reply.hpp"
#include "internal/observability/logging.hpp"
#include "internal/schema/attribute_schema.hpp"
#include "internal/util/errors.hpp"

namespace tracebrain::query {

using google::protobuf::Value;
using tracebrain::query::v1::QueryKind;
using tracebrain::query::v1::StructuredQuery;
using tracebrain::query::v1::TraceFilter;

namespace {

constexpr int kMaxLimit = 50;

constexpr const char* kSystemPrompt =
    "You translate questions about recorded AI agent traces into a JSON query. "
    "Reply with one JSON object and nothing else.";

struct KindRule {
  QueryKind        kind;
  std::string_view name;
  bool             takes_filter;
  bool             takes_limit;
  bool             needs_trace_id;
  bool             needs_episode_id;
};

constexpr std::array<KindRule, 6> kKinds = {{
    {tracebrain::query::v1::QUERY_KIND_LIST_TRACES, "list_traces", true, true, false, false},
    {tracebrain::query::v1::QUERY_KIND_GET_TRACE, "get_trace", false, false, true, false},
    {tracebrain::query::v1::QUERY_KIND_TRACE_STATS, "trace_stats", true, false, false, false},
    {tracebrain::query::v1::QUERY_KIND_TOOL_USAGE, "tool_usage", true, false, false, false},
    {tracebrain::query::v1::QUERY_KIND_EPISODE_TRACES, "episode_traces", false, false, false, true},
    {tracebrain::query::v1::QUERY_KIND_LIST_EPISODES, "list_episodes", true, true, false, false},
}};

[[noreturn]] void Reject(const std::string& reason) {
  throw util::TranslationFailed("query rejected: " + reason);
}

const std::string& AsString(const Value& value, const std::string& field) {
  if (value.kind_case() != Value::kStringValue) {
    Reject("'" + field + "' must be a string");
  }
  return value.string_value();
}

double AsNumber(const Value& value, const std::string& field) {
  if (value.kind_case() != Value::kNumberValue || !std::isfinite(value.number_value())) {
    Reject("'" + field + "' must be a number");
  }
  return value.number_value();
}

int AsInteger(const Value& value, const std::string& field, int min, int max) {
  const double number = AsNumber(value, field);
  if (std::floor(number) != number || number < min || number > max) {
    Reject("'" + field + "' must be an integer within [" + std::to_string(min) + ", " + std::to_string(max) + "]");
  }
  return static_cast<int>(number);
}

double AsUnitInterval(const Value& value, const std::string& field) {
  const double number = AsNumber(value, field);
  if (number < 0.0 || number > 1.0) {
    Reject("'" + field + "' must be within [0, 1]");
  }
  return number;
}

google::protobuf::Timestamp AsTimestamp(const Value& value, const std::string& field) {
  google::protobuf::Timestamp ts;
  if (!google::protobuf::util::TimeUtil::FromString(AsString(value, field), &ts)) {
    Reject("'" + field + "' must be an RFC 3339 timestamp");
  }
  return ts;
}

TraceFilter ParseFilter(const Value& value, const KindRule& rule) {
  if (value.kind_case() != Value::kStructValue) {
    Reject("'filter' must be an object");
  }

  TraceFilter filter;
  for (const auto& [key, field] : value.struct_value().fields()) {
    const auto name = "filter." + key;
    // episodes are filtered on their average confidence only
    if (rule.kind == tracebrain::query::v1::QUERY_KIND_LIST_EPISODES && key != "max_confidence") {
      Reject("'" + name + "' is not accepted by " + std::string(rule.name));
    }

    if (key == "status") {
      const auto& status = AsString(field, name);
      if (!schema::ParseTraceStatus(status)) Reject("unknown status '" + status + "'");
      filter.set_status(status);
    } else if (key == "error_type") {
      const auto& error_type = AsString(field, name);
      if (!schema::ParseErrorType(error_type)) Reject("unknown error_type '" + error_type + "'");
      filter.set_error_type(error_type);
    } else if (key == "min_rating") {
      filter.set_min_rating(AsInteger(field, name, 1, 5));
    } else if (key == "min_confidence") {
      filter.set_min_confidence(AsUnitInterval(field, name));
    } else if (key == "max_confidence") {
      filter.set_max_confidence(AsUnitInterval(field, name));
    } else if (key == "start_time") {
      *filter.mutable_start_time() = AsTimestamp(field, name);
    } else if (key == "end_time") {
      *filter.mutable_end_time() = AsTimestamp(field, name);
    } else if (key == "episode_id") {
      filter.set_episode_id(AsString(field, name));
    } else if (key == "system_prompt_contains") {
      filter.set_system_prompt_contains(AsString(field, name));
    } else {
      Reject("unknown filter field '" + key + "'");
    }
  }

  try {
    core::ValidateFilter(filter);
  } catch (const util::ValidationError& e) {
    Reject(e.what());
  }
  return filter;
}

} // namespace

QueryTranslator::QueryTranslator(std::shared_ptr<llm::LanguageModelProvider> provider, TranslatorOptions options)
    : provider_(std::move(provider)), options_(options) {
}

std::string QueryTranslator::BuildPrompt(const std::string& question) {
  return "Translate the question into a JSON object with these fields:\n"
         "  kind: one of list_traces, get_trace, trace_stats, tool_usage, episode_traces, list_episodes\n"
         "  filter (list_traces, trace_stats, tool_usage): object with any of\n"
         "    status: running | completed | needs_review | failed\n"
         "    error_type: none | tool_error | llm_error | timeout | parse_error | logic_error\n"
         "    min_rating: integer 1-5\n"
         "    min_confidence, max_confidence: number 0-1\n"
         "    start_time, end_time: RFC 3339 timestamp\n"
         "    episode_id: string\n"
         "    system_prompt_contains: string\n"
         "  filter (list_episodes): object with only max_confidence\n"
         "  trace_id: string, required for get_trace\n"
         "  episode_id: string, required for episode_traces\n"
         "  limit: integer 1-50, for list_traces and list_episodes\n"
         "Omit fields the question does not constrain. Do not add other fields.\n\n"
         "Question: " +
         question;
}

StructuredQuery QueryTranslator::Parse(const std::string& model_output) {
  auto object = llm::ParseJsonReply(model_output);
  if (!object) {
    Reject("model output is not a JSON object");
  }

  const auto& fields = object->fields();
  auto        kind_it = fields.find("kind");
  if (kind_it == fields.end()) {
    Reject("'kind' is required");
  }
  const auto& kind_name = AsString(kind_it->second, "kind");

  const KindRule* rule = nullptr;
  for (const auto& candidate : kKinds) {
    if (candidate.name == kind_name) {
      rule = &candidate;
    }
  }
  if (!rule) {
    Reject("unknown kind '" + kind_name + "'");
  }

  StructuredQuery query;
  query.set_kind(rule->kind);

  for (const auto& [key, value] : fields) {
    if (key == "kind") {
      continue;
    }
    if (key == "filter" && rule->takes_filter) {
      *query.mutable_filter() = ParseFilter(value, *rule);
    } else if (key == "limit" && rule->takes_limit) {
      query.set_limit(AsInteger(value, "limit", 1, kMaxLimit));
    } else if (key == "trace_id" && rule->needs_trace_id) {
      query.set_trace_id(AsString(value, "trace_id"));
    } else if (key == "episode_id" && rule->needs_episode_id) {
      query.set_episode_id(AsString(value, "episode_id"));
    } else {
      Reject("field '" + key + "' is not accepted by " + std::string(rule->name));
    }
  }

  if (rule->needs_trace_id && query.trace_id().empty()) {
    Reject("get_trace requires a trace_id");
  }
  if (rule->needs_episode_id && query.episode_id().empty()) {
    Reject("episode_traces requires an episode_id");
  }
  return query;
}

StructuredQuery QueryTranslator::Translate(const std::string& question, const util::Deadline& deadline) {
  if (question.find_first_not_of(" \t\r\n") == std::string::npos) {
    throw util::ValidationError("question is empty");
  }
  if (!provider_) {
    throw util::TranslationFailed("no language model provider is configured");
  }

  llm::CompletionOptions completion;
  completion.system      = kSystemPrompt;
  completion.temperature = options_.temperature;
  completion.max_tokens  = options_.max_tokens;
  completion.json_output = true;
  completion.deadline    = deadline;

  const auto prompt = BuildPrompt(question);

  return llm::WithRetries<util::TranslationFailed>(options_.retry, deadline, "translate", [&](uint32_t) {
    std::string output;
    try {
      output = provider_->Complete(prompt, completion);
    } catch (const util::ProviderError& e) {
      throw util::TranslationFailed(std::string("model provider failed: ") + e.what());
    }
    auto query = Parse(output);
    TRACEBRAIN_LOG_DEBUG("question translated", {observability::StringField("kind", tracebrain::query::v1::QueryKind_Name(query.kind()))});
    return query;
  });
}

} // namespace tracebrain::query
