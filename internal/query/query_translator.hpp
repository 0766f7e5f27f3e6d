#pragma once

#include <memory>
#include <string>

#include "internal/llm/provider.hpp"
#include "internal/llm/retry.hpp"
#include "internal/util/deadline.hpp"
#include "tracebrain/query/v1/query.pb.h"

namespace tracebrain::query {

struct TranslatorOptions {
  llm::RetryPolicy retry;
  double           temperature = 0.0;
  uint32_t         max_tokens  = 512;
};

/*
  Natural language -> StructuredQuery.

  The model's answer must be a JSON object in the closed query grammar.
  Anything outside it (unknown field, unknown kind or enum value, wrong
  JSON type, out-of-range number, a field the kind does not take) is
  rejected, never coerced. The only leniency is unwrapping a fenced code
  block around the object.

  Provider errors and rejected output are retried per RetryPolicy, then
  surface as util::TranslationFailed.
*/
class QueryTranslator {
 public:
  QueryTranslator(std::shared_ptr<llm::LanguageModelProvider> provider, TranslatorOptions options = {});

  tracebrain::query::v1::StructuredQuery Translate(const std::string& question, const util::Deadline& deadline = {});

  // Throws util::TranslationFailed.
  static tracebrain::query::v1::StructuredQuery Parse(const std::string& model_output);

  static std::string BuildPrompt(const std::string& question);

 private:
  std::shared_ptr<llm::LanguageModelProvider> provider_;
  TranslatorOptions                           options_;
};

} // namespace tracebrain::query
