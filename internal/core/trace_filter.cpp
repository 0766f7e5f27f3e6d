#include "trace_filter.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include "internal/schema/attribute_keys.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace tracebrain::core {

using tracebrain::core::v1::Trace;
using tracebrain::query::v1::TraceFilter;

namespace {

std::string Lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

const google::protobuf::Value* Field(const Trace& trace, const char* key) {
  const auto& fields = trace.attributes().fields();
  auto        it     = fields.find(key);
  return it == fields.end() ? nullptr : &it->second;
}

std::string StringField(const Trace& trace, const char* key) {
  const auto* value = Field(trace, key);
  if (!value || value->kind_case() != google::protobuf::Value::kStringValue) {
    return {};
  }
  return value->string_value();
}

} // namespace

void ValidateFilter(const TraceFilter& filter) {
  if (!filter.status().empty() && !schema::ParseTraceStatus(filter.status())) {
    throw util::ValidationError("unknown status filter '" + filter.status() + "'");
  }
  if (!filter.error_type().empty() && !schema::ParseErrorType(filter.error_type())) {
    throw util::ValidationError("unknown error_type filter '" + filter.error_type() + "'");
  }
  if (filter.has_min_rating() && (filter.min_rating() < 1 || filter.min_rating() > 5)) {
    throw util::ValidationError("min_rating must be within [1, 5]");
  }
  if (filter.has_min_confidence() && (filter.min_confidence() < 0.0 || filter.min_confidence() > 1.0)) {
    throw util::ValidationError("min_confidence must be within [0, 1]");
  }
  if (filter.has_max_confidence() && (filter.max_confidence() < 0.0 || filter.max_confidence() > 1.0)) {
    throw util::ValidationError("max_confidence must be within [0, 1]");
  }
  if (filter.has_min_confidence() && filter.has_max_confidence() && filter.min_confidence() > filter.max_confidence()) {
    throw util::ValidationError("min_confidence is greater than max_confidence");
  }
  if (filter.has_start_time() && filter.has_end_time() &&
      util::ToUnixNanos(filter.start_time()) > util::ToUnixNanos(filter.end_time())) {
    throw util::ValidationError("start_time is after end_time");
  }
}

std::optional<int> LatestFeedbackRating(const Trace& trace) {
  for (auto it = trace.feedbacks().rbegin(); it != trace.feedbacks().rend(); ++it) {
    if (it->rating() > 0) {
      return it->rating();
    }
  }
  return std::nullopt;
}

std::optional<schema::Evaluation> EvaluationOf(const Trace& trace) {
  const auto* value = Field(trace, schema::keys::AI_EVALUATION);
  if (!value) {
    return std::nullopt;
  }
  return schema::ParseEvaluation(*value);
}

std::optional<int> EffectiveRating(const Trace& trace) {
  if (auto rating = LatestFeedbackRating(trace)) {
    return rating;
  }
  auto evaluation = EvaluationOf(trace);
  if (evaluation && evaluation->rating > 0) {
    return evaluation->rating;
  }
  return std::nullopt;
}

bool Matches(const TraceFilter& filter, const Trace& trace) {
  // a trace without the attribute matches no status / error_type filter
  if (!filter.status().empty() && StringField(trace, schema::keys::TRACE_STATUS) != filter.status()) {
    return false;
  }
  if (!filter.error_type().empty() && StringField(trace, schema::keys::TRACE_ERROR_TYPE) != filter.error_type()) {
    return false;
  }
  if (!filter.episode_id().empty() && StringField(trace, schema::keys::EPISODE_ID) != filter.episode_id()) {
    return false;
  }
  if (!filter.system_prompt_contains().empty()) {
    auto prompt = Lower(StringField(trace, schema::keys::SYSTEM_PROMPT));
    if (prompt.find(Lower(filter.system_prompt_contains())) == std::string::npos) {
      return false;
    }
  }

  if (filter.has_min_rating()) {
    auto rating = EffectiveRating(trace);
    if (!rating || *rating < filter.min_rating()) {
      return false;
    }
  }

  if (filter.has_min_confidence() || filter.has_max_confidence()) {
    auto evaluation = EvaluationOf(trace);
    if (!evaluation) {
      return false;
    }
    if (filter.has_min_confidence() && evaluation->confidence < filter.min_confidence()) {
      return false;
    }
    if (filter.has_max_confidence() && evaluation->confidence > filter.max_confidence()) {
      return false;
    }
  }

  const auto created = util::ToUnixNanos(trace.created_at());
  if (filter.has_start_time() && created < util::ToUnixNanos(filter.start_time())) {
    return false;
  }
  if (filter.has_end_time() && created > util::ToUnixNanos(filter.end_time())) {
    return false;
  }
  return true;
}

} // namespace tracebrain::core
