#include "attribute_schema.hpp"

#include <array>
#include <cctype>
#include <cmath>
#include <utility>

#include "internal/schema/attribute_keys.hpp"
#include "internal/util/errors.hpp"

namespace tracebrain::schema {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;
using tracebrain::util::ValidationError;

constexpr std::array<std::pair<SpanType, std::string_view>, 3> kSpanTypes = {{
    {SpanType::kUserRequest, "user_request"},
    {SpanType::kLlmInference, "llm_inference"},
    {SpanType::kToolExecution, "tool_execution"},
}};

constexpr std::array<std::pair<TraceStatus, std::string_view>, 4> kTraceStatuses = {{
    {TraceStatus::kRunning, "running"},
    {TraceStatus::kCompleted, "completed"},
    {TraceStatus::kNeedsReview, "needs_review"},
    {TraceStatus::kFailed, "failed"},
}};

constexpr std::array<std::pair<ErrorType, std::string_view>, 6> kErrorTypes = {{
    {ErrorType::kNone, "none"},
    {ErrorType::kToolError, "tool_error"},
    {ErrorType::kLlmError, "llm_error"},
    {ErrorType::kTimeout, "timeout"},
    {ErrorType::kParseError, "parse_error"},
    {ErrorType::kLogicError, "logic_error"},
}};

constexpr std::array<std::pair<Priority, std::string_view>, 3> kPriorities = {{
    {Priority::kLow, "low"},
    {Priority::kMedium, "medium"},
    {Priority::kHigh, "high"},
}};

template <typename Enum, std::size_t N>
std::string_view NameOf(const std::array<std::pair<Enum, std::string_view>, N>& table, Enum value) {
  for (const auto& [e, name] : table) {
    if (e == value) {
      return name;
    }
  }
  return "unknown";
}

template <typename Enum, std::size_t N>
std::optional<Enum> Lookup(const std::array<std::pair<Enum, std::string_view>, N>& table, std::string_view value) {
  for (const auto& [e, name] : table) {
    if (name == value) {
      return e;
    }
  }
  return std::nullopt;
}

const std::string& RequireString(const Value& value, std::string_view key, const std::string& span_id) {
  if (value.kind_case() != Value::kStringValue) {
    throw ValidationError("attribute '" + std::string(key) + "' must be a string", span_id);
  }
  return value.string_value();
}

double RequireNumber(const Value& value, std::string_view key, const std::string& span_id) {
  if (value.kind_case() != Value::kNumberValue || !std::isfinite(value.number_value())) {
    throw ValidationError("attribute '" + std::string(key) + "' must be a finite number", span_id);
  }
  return value.number_value();
}

const Struct& RequireObject(const Value& value, std::string_view key, const std::string& span_id) {
  if (value.kind_case() != Value::kStructValue) {
    throw ValidationError("attribute '" + std::string(key) + "' must be an object", span_id);
  }
  return value.struct_value();
}

template <typename Enum, std::size_t N>
Enum RequireEnum(const std::array<std::pair<Enum, std::string_view>, N>& table, const Value& value, std::string_view key,
                 const std::string& span_id) {
  const auto& text   = RequireString(value, key, span_id);
  auto        parsed = Lookup(table, text);
  if (!parsed) {
    throw ValidationError("attribute '" + std::string(key) + "' has unknown value '" + text + "'", span_id);
  }
  return *parsed;
}

int64_t RequireTokenCount(const Value& value, std::string_view key, const std::string& span_id) {
  const double number = RequireNumber(value, key, span_id);
  if (number < 0 || std::floor(number) != number) {
    throw ValidationError("token count '" + std::string(key) + "' must be a non-negative integer", span_id);
  }
  return static_cast<int64_t>(number);
}

TokenUsage ParseUsage(const Value& value, const std::string& span_id) {
  const auto& fields = RequireObject(value, keys::USAGE, span_id).fields();

  TokenUsage usage;
  if (auto it = fields.find(keys::USAGE_PROMPT_TOKENS); it != fields.end()) {
    usage.prompt_tokens = RequireTokenCount(it->second, keys::USAGE_PROMPT_TOKENS, span_id);
  }
  if (auto it = fields.find(keys::USAGE_COMPLETION_TOKENS); it != fields.end()) {
    usage.completion_tokens = RequireTokenCount(it->second, keys::USAGE_COMPLETION_TOKENS, span_id);
  }
  if (auto it = fields.find(keys::USAGE_TOTAL_TOKENS); it != fields.end()) {
    usage.total_tokens = RequireTokenCount(it->second, keys::USAGE_TOTAL_TOKENS, span_id);
  } else {
    usage.total_tokens = usage.prompt_tokens + usage.completion_tokens;
  }
  return usage;
}

StatusCode ParseStatusCode(const Value& value, const std::string& span_id) {
  std::string code = RequireString(value, keys::OTEL_STATUS_CODE, span_id);
  for (auto& c : code) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  if (code == "ERROR") return StatusCode::kError;
  if (code == "OK") return StatusCode::kOk;
  if (code == "UNSET") return StatusCode::kUnset;
  throw ValidationError("attribute 'otel.status_code' has unknown value '" + value.string_value() + "'", span_id);
}

} // namespace

std::string_view ToString(SpanType type) {
  return NameOf(kSpanTypes, type);
}

std::string_view ToString(TraceStatus status) {
  return NameOf(kTraceStatuses, status);
}

std::string_view ToString(ErrorType type) {
  return NameOf(kErrorTypes, type);
}

std::string_view ToString(Priority priority) {
  return NameOf(kPriorities, priority);
}

std::optional<SpanType> ParseSpanType(std::string_view value) {
  return Lookup(kSpanTypes, value);
}

std::optional<TraceStatus> ParseTraceStatus(std::string_view value) {
  return Lookup(kTraceStatuses, value);
}

std::optional<ErrorType> ParseErrorType(std::string_view value) {
  return Lookup(kErrorTypes, value);
}

std::optional<Priority> ParsePriority(std::string_view value) {
  return Lookup(kPriorities, value);
}

std::optional<SpanType> SpanAttributes::type() const {
  if (std::holds_alternative<UserRequest>(payload)) return SpanType::kUserRequest;
  if (std::holds_alternative<LlmInference>(payload)) return SpanType::kLlmInference;
  if (std::holds_alternative<ToolExecution>(payload)) return SpanType::kToolExecution;
  return std::nullopt;
}

Evaluation ParseEvaluation(const Value& value, const std::string& span_id) {
  const auto& fields = RequireObject(value, keys::AI_EVALUATION, span_id).fields();

  Evaluation evaluation;

  auto confidence = fields.find(keys::EVAL_CONFIDENCE);
  if (confidence == fields.end()) {
    throw ValidationError("evaluation is missing 'confidence'", span_id);
  }
  evaluation.confidence = RequireNumber(confidence->second, keys::EVAL_CONFIDENCE, span_id);
  if (evaluation.confidence < 0.0 || evaluation.confidence > 1.0) {
    throw ValidationError("evaluation confidence must be within [0, 1]", span_id);
  }

  if (auto it = fields.find(keys::EVAL_RATING); it != fields.end()) {
    const double rating = RequireNumber(it->second, keys::EVAL_RATING, span_id);
    if (rating < 1 || rating > 5 || std::floor(rating) != rating) {
      throw ValidationError("evaluation rating must be an integer within [1, 5]", span_id);
    }
    evaluation.rating = static_cast<int>(rating);
  }
  if (auto it = fields.find(keys::EVAL_STATUS); it != fields.end()) {
    evaluation.status = RequireString(it->second, keys::EVAL_STATUS, span_id);
  }
  if (auto it = fields.find(keys::EVAL_FEEDBACK); it != fields.end()) {
    evaluation.feedback = RequireString(it->second, keys::EVAL_FEEDBACK, span_id);
  }
  if (auto it = fields.find(keys::EVAL_JUDGE_MODEL); it != fields.end()) {
    evaluation.judge_model = RequireString(it->second, keys::EVAL_JUDGE_MODEL, span_id);
  }
  return evaluation;
}

Value EvaluationToValue(const Evaluation& evaluation) {
  Value value;
  auto& fields = *value.mutable_struct_value()->mutable_fields();
  if (evaluation.rating > 0) {
    fields[keys::EVAL_RATING].set_number_value(evaluation.rating);
  }
  fields[keys::EVAL_CONFIDENCE].set_number_value(evaluation.confidence);
  fields[keys::EVAL_STATUS].set_string_value(evaluation.status);
  fields[keys::EVAL_FEEDBACK].set_string_value(evaluation.feedback);
  if (!evaluation.judge_model.empty()) {
    fields[keys::EVAL_JUDGE_MODEL].set_string_value(evaluation.judge_model);
  }
  return value;
}

SpanAttributes ParseSpanAttributes(const Struct& attributes, const std::string& span_id) {
  SpanAttributes out;

  std::optional<SpanType> type;
  LlmInference            llm;
  ToolExecution           tool;

  for (const auto& [key, value] : attributes.fields()) {
    if (key == keys::SPAN_TYPE) {
      type = RequireEnum(kSpanTypes, value, key, span_id);
    } else if (key == keys::LLM_NEW_CONTENT) {
      out.delta = RequireString(value, key, span_id);
    } else if (key == keys::LLM_COMPLETION) {
      llm.completion = RequireString(value, key, span_id);
    } else if (key == keys::LLM_THOUGHT) {
      llm.thought = RequireString(value, key, span_id);
    } else if (key == keys::LLM_TOOL_CODE) {
      llm.tool_code = RequireString(value, key, span_id);
    } else if (key == keys::LLM_FINAL_ANSWER) {
      llm.final_answer = RequireString(value, key, span_id);
    } else if (key == keys::LLM_MODEL) {
      llm.model = RequireString(value, key, span_id);
    } else if (key == keys::TOOL_NAME) {
      tool.tool_name = RequireString(value, key, span_id);
    } else if (key == keys::TOOL_INPUT) {
      tool.input = value;
    } else if (key == keys::TOOL_OUTPUT) {
      tool.output = value;
    } else if (key == keys::USAGE) {
      out.usage = ParseUsage(value, span_id);
    } else if (key == keys::OTEL_STATUS_CODE) {
      out.status.code = ParseStatusCode(value, span_id);
    } else if (key == keys::OTEL_STATUS_DESC) {
      out.status.description = RequireString(value, key, span_id);
    } else if (key == keys::AI_EVALUATION) {
      out.evaluation = ParseEvaluation(value, span_id);
    } else {
      (*out.extensions.mutable_fields())[key] = value;
    }
  }

  if (type) {
    switch (*type) {
      case SpanType::kUserRequest:
        out.payload = UserRequest{};
        break;
      case SpanType::kLlmInference:
        out.payload = std::move(llm);
        break;
      case SpanType::kToolExecution:
        out.payload = std::move(tool);
        break;
    }
  }
  return out;
}

TraceAttributes ParseTraceAttributes(const Struct& attributes) {
  TraceAttributes out;
  const std::string no_span;

  for (const auto& [key, value] : attributes.fields()) {
    if (key == keys::TRACE_STATUS) {
      out.status = RequireEnum(kTraceStatuses, value, key, no_span);
    } else if (key == keys::TRACE_PRIORITY) {
      out.priority = RequireEnum(kPriorities, value, key, no_span);
    } else if (key == keys::TRACE_ERROR_TYPE) {
      out.error_type = RequireEnum(kErrorTypes, value, key, no_span);
    } else if (key == keys::EPISODE_ID) {
      out.episode_id = RequireString(value, key, no_span);
    } else if (key == keys::SYSTEM_PROMPT) {
      out.system_prompt = RequireString(value, key, no_span);
    } else if (key == keys::AI_EVALUATION) {
      out.evaluation = ParseEvaluation(value);
    } else {
      (*out.extensions.mutable_fields())[key] = value;
    }
  }
  return out;
}

} // namespace tracebrain::schema
