#include "evaluator.hpp"

#include <chrono>
#include <sstream>

#include "internal/core/trace_store.hpp"
#include "internal/llm/json_reply.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/reconstruction/span_forest.hpp"
#include "internal/schema/attribute_keys.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace tracebrain::evaluation {

using tracebrain::core::v1::Span;
using tracebrain::core::v1::Trace;

namespace {

constexpr const char* kSystemPrompt =
    "You review transcripts of AI agent runs and grade how well the agent completed its task. "
    "Reply with one JSON object and nothing else.";

constexpr std::size_t kMaxExcerpt = 4000;

std::string Excerpt(const std::string& text) {
  if (text.size() <= kMaxExcerpt) {
    return text;
  }
  return text.substr(text.size() - kMaxExcerpt);
}

} // namespace

Evaluator::Evaluator(std::shared_ptr<core::TraceStore> store, std::shared_ptr<llm::LanguageModelProvider> provider, EvaluatorOptions options)
    : store_(std::move(store)), provider_(std::move(provider)), options_(std::move(options)) {
}

std::string Evaluator::BuildPrompt(const Trace& trace) {
  std::ostringstream prompt;
  prompt << "Trace " << trace.trace_id() << "\n";

  const auto& attributes = trace.attributes().fields();
  if (auto it = attributes.find(schema::keys::SYSTEM_PROMPT); it != attributes.end()) {
    prompt << "\nSystem prompt:\n" << util::ValueToText(it->second) << "\n";
  }

  std::vector<Span> spans(trace.spans().begin(), trace.spans().end());
  auto              forest = reconstruction::SpanForest::Build(std::move(spans));

  prompt << "\nTool calls:\n";
  bool any_tool = false;
  for (const auto& span : forest.Spans()) {
    auto        typed = schema::ParseSpanAttributes(span.attributes(), span.span_id());
    const auto* tool  = typed.tool();
    if (!tool) {
      continue;
    }
    any_tool = true;
    prompt << "- " << (tool->tool_name.empty() ? "unknown" : tool->tool_name);
    if (tool->input) {
      prompt << " input=" << util::ValueToText(*tool->input);
    }
    if (tool->output) {
      prompt << " output=" << Excerpt(util::ValueToText(*tool->output));
    }
    if (typed.status.IsError()) {
      prompt << " [error: " << typed.status.description << "]";
    }
    prompt << "\n";
  }
  if (!any_tool) {
    prompt << "(none)\n";
  }

  // leaves carry the full reconstructed conversation of their branch
  for (const auto& leaf : forest.Leaves()) {
    prompt << "\nTranscript ending at span " << leaf << ":\n" << Excerpt(forest.Reconstruct(leaf)) << "\n";
  }

  prompt << "\nReturn a JSON object with exactly these fields:\n"
            "  rating: integer 1-5\n"
            "  confidence: number 0-1, how sure you are of the rating\n"
            "  status: short label such as success, partial or failure\n"
            "  feedback: one or two sentences explaining the rating\n";
  return prompt.str();
}

schema::Evaluation Evaluator::ParseVerdict(const std::string& output) {
  auto verdict = llm::ParseJsonReply(output);
  if (!verdict) {
    throw util::ProviderError("judge output is not a JSON object");
  }
  for (const auto& [key, value] : verdict->fields()) {
    if (key != schema::keys::EVAL_RATING && key != schema::keys::EVAL_CONFIDENCE && key != schema::keys::EVAL_STATUS &&
        key != schema::keys::EVAL_FEEDBACK) {
      throw util::ProviderError("judge output has unexpected field '" + key + "'");
    }
  }
  if (!verdict->fields().contains(schema::keys::EVAL_RATING)) {
    throw util::ProviderError("judge output is missing 'rating'");
  }

  google::protobuf::Value value;
  *value.mutable_struct_value() = *verdict;
  try {
    return schema::ParseEvaluation(value);
  } catch (const util::ValidationError& e) {
    throw util::ProviderError(std::string("judge output rejected: ") + e.what());
  }
}

schema::Evaluation Evaluator::Evaluate(const std::string& trace_id, const std::string& judge_model) {
  observability::SpanScope scope("Evaluator.Evaluate");
  scope.SetAttribute("trace_id", trace_id);

  if (!provider_) {
    throw util::ProviderError("no language model provider is configured");
  }

  const auto started  = std::chrono::steady_clock::now();
  const auto deadline = util::Deadline::After(options_.budget);

  auto trace  = store_->Get(trace_id, deadline);
  auto prompt = BuildPrompt(trace);

  // request, then configuration; empty keeps the provider's own model
  const auto judge = !judge_model.empty() ? judge_model : options_.judge_model;

  llm::CompletionOptions completion;
  completion.model       = judge;
  completion.system      = kSystemPrompt;
  completion.temperature = options_.temperature;
  completion.max_tokens  = options_.max_tokens;
  completion.json_output = true;
  completion.deadline    = deadline;

  auto elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  };

  schema::Evaluation evaluation;
  try {
    evaluation = llm::WithRetries<util::ProviderError>(options_.retry, deadline, "evaluate", [&](uint32_t) {
      return ParseVerdict(provider_->Complete(prompt, completion));
    });
    evaluation.judge_model = !judge.empty() ? judge : provider_->Name();

    store_->SetEvaluation(trace_id, evaluation, deadline);
  } catch (const std::exception& e) {
    observability::Metrics::Instance().ObserveEvaluationDurationMs(elapsed_ms(), false);
    scope.RecordException(e.what());
    throw;
  }

  observability::Metrics::Instance().ObserveEvaluationDurationMs(elapsed_ms(), true);
  TRACEBRAIN_LOG_INFO("trace evaluated", {observability::StringField("trace_id", trace_id),
                                          observability::IntField("rating", evaluation.rating),
                                          observability::DoubleField("confidence", evaluation.confidence)});
  return evaluation;
}

} // namespace tracebrain::evaluation
