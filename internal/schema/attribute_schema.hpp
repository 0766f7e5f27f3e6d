#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <google/protobuf/struct.pb.h>

namespace tracebrain::schema {

/*
  Typed view over the open attribute bag of spans and traces.

  Parsing never drops information: the persisted form is always the
  original Struct, and keys outside the well-known set end up in
  `extensions` untouched. Known keys holding the wrong JSON kind or an
  out-of-range value raise util::ValidationError.
*/

enum class SpanType { kUserRequest, kLlmInference, kToolExecution };

enum class TraceStatus { kRunning, kCompleted, kNeedsReview, kFailed };

enum class ErrorType { kNone, kToolError, kLlmError, kTimeout, kParseError, kLogicError };

enum class Priority { kLow, kMedium, kHigh };

enum class StatusCode { kUnset, kOk, kError };

std::string_view ToString(SpanType type);
std::string_view ToString(TraceStatus status);
std::string_view ToString(ErrorType type);
std::string_view ToString(Priority priority);

std::optional<SpanType>    ParseSpanType(std::string_view value);
std::optional<TraceStatus> ParseTraceStatus(std::string_view value);
std::optional<ErrorType>   ParseErrorType(std::string_view value);
std::optional<Priority>    ParsePriority(std::string_view value);

struct TokenUsage {
  int64_t prompt_tokens     = 0;
  int64_t completion_tokens = 0;
  int64_t total_tokens      = 0;
};

struct ErrorStatus {
  StatusCode  code = StatusCode::kUnset;
  std::string description;

  bool IsError() const {
    return code == StatusCode::kError;
  }
};

struct Evaluation {
  int         rating     = 0; // 1..5
  double      confidence = 0.0;
  std::string status;
  std::string feedback;
  std::string judge_model;
};

struct UserRequest {};

struct LlmInference {
  std::string model;
  std::string completion;
  std::string thought;
  std::string tool_code;
  std::string final_answer;
};

struct ToolExecution {
  std::string                            tool_name;
  std::optional<google::protobuf::Value> input;
  std::optional<google::protobuf::Value> output;
};

// Spans without a type key.
struct Unclassified {};

using SpanPayload = std::variant<Unclassified, UserRequest, LlmInference, ToolExecution>;

struct SpanAttributes {
  SpanPayload payload;

  // Incremental text produced by this span only.
  std::optional<std::string> delta;

  std::optional<TokenUsage> usage;
  ErrorStatus               status;
  std::optional<Evaluation> evaluation;

  google::protobuf::Struct extensions;

  std::optional<SpanType> type() const;

  const ToolExecution* tool() const {
    return std::get_if<ToolExecution>(&payload);
  }
};

struct TraceAttributes {
  std::optional<TraceStatus> status;
  std::optional<Priority>    priority;
  std::optional<ErrorType>   error_type;
  std::string                episode_id;
  std::string                system_prompt;
  std::optional<Evaluation>  evaluation;

  google::protobuf::Struct extensions;
};

// span_id is only used to label errors.
SpanAttributes  ParseSpanAttributes(const google::protobuf::Struct& attributes, const std::string& span_id);
TraceAttributes ParseTraceAttributes(const google::protobuf::Struct& attributes);

Evaluation              ParseEvaluation(const google::protobuf::Value& value, const std::string& span_id = {});
google::protobuf::Value EvaluationToValue(const Evaluation& evaluation);

} // namespace tracebrain::schema
