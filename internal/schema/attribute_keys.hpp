#pragma once

namespace tracebrain::schema::keys {

/*
  Well-known attribute keys. Everything else in an attribute bag is kept
  verbatim as an extension.
*/

// span level
static constexpr const char* SPAN_TYPE          = "tracebrain.span.type";
static constexpr const char* LLM_NEW_CONTENT    = "tracebrain.llm.new_content";
static constexpr const char* LLM_COMPLETION     = "tracebrain.llm.completion";
static constexpr const char* LLM_THOUGHT        = "tracebrain.llm.thought";
static constexpr const char* LLM_TOOL_CODE      = "tracebrain.llm.tool_code";
static constexpr const char* LLM_FINAL_ANSWER   = "tracebrain.llm.final_answer";
static constexpr const char* LLM_MODEL          = "tracebrain.llm.model";
static constexpr const char* TOOL_NAME          = "tracebrain.tool.name";
static constexpr const char* TOOL_INPUT         = "tracebrain.tool.input";
static constexpr const char* TOOL_OUTPUT        = "tracebrain.tool.output";
static constexpr const char* USAGE              = "tracebrain.usage";
static constexpr const char* OTEL_STATUS_CODE   = "otel.status_code";
static constexpr const char* OTEL_STATUS_DESC   = "otel.status_description";

// trace level
static constexpr const char* SYSTEM_PROMPT      = "system_prompt";
static constexpr const char* EPISODE_ID         = "tracebrain.episode.id";
static constexpr const char* TRACE_STATUS       = "tracebrain.trace.status";
static constexpr const char* TRACE_PRIORITY     = "tracebrain.trace.priority";
static constexpr const char* TRACE_ERROR_TYPE   = "tracebrain.trace.error_type";

// both levels
static constexpr const char* AI_EVALUATION      = "tracebrain.ai_evaluation";

// fields of the usage object
static constexpr const char* USAGE_PROMPT_TOKENS     = "prompt_tokens";
static constexpr const char* USAGE_COMPLETION_TOKENS = "completion_tokens";
static constexpr const char* USAGE_TOTAL_TOKENS      = "total_tokens";

// fields of the evaluation object
static constexpr const char* EVAL_RATING      = "rating";
static constexpr const char* EVAL_CONFIDENCE  = "confidence";
static constexpr const char* EVAL_STATUS      = "status";
static constexpr const char* EVAL_FEEDBACK    = "feedback";
static constexpr const char* EVAL_JUDGE_MODEL = "judge_model";

} // namespace tracebrain::schema::keys
