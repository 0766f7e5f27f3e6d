#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "internal/llm/provider.hpp"
#include "internal/llm/retry.hpp"
#include "internal/schema/attribute_schema.hpp"
#include "tracebrain/core/v1/trace.pb.h"

namespace tracebrain::core {
class TraceStore;
}

namespace tracebrain::evaluation {

struct EvaluatorOptions {
  llm::RetryPolicy retry;
  std::string      judge_model;
  double           temperature = 0.0;
  uint32_t         max_tokens  = 512;

  // Wall-clock budget for one evaluation, retries included.
  std::chrono::milliseconds budget{300000};
};

/*
  Asks the judge model to grade a trace and stores the verdict as the
  trace's evaluation block. The verdict must be a JSON object with exactly
  rating, confidence, status and feedback; anything else is treated as a
  provider failure and retried. The trace is only written once a verdict
  parses.
*/
class Evaluator {
 public:
  Evaluator(std::shared_ptr<core::TraceStore> store, std::shared_ptr<llm::LanguageModelProvider> provider, EvaluatorOptions options = {});

  schema::Evaluation Evaluate(const std::string& trace_id, const std::string& judge_model = {});

  static std::string BuildPrompt(const tracebrain::core::v1::Trace& trace);

  // Throws util::ProviderError for output outside the verdict schema.
  static schema::Evaluation ParseVerdict(const std::string& output);

 private:
  std::shared_ptr<core::TraceStore>           store_;
  std::shared_ptr<llm::LanguageModelProvider> provider_;
  EvaluatorOptions                            options_;
};

} // namespace tracebrain::evaluation
