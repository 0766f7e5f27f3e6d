#pragma once

#include <cstdint>
#include <string>

#include "internal/util/deadline.hpp"

namespace tracebrain::llm {

struct CompletionOptions {
  // Overrides the provider's configured model when set.
  std::string model;
  std::string system;
  double      temperature = 0.0;
  // 0 lets the provider pick.
  uint32_t    max_tokens  = 0;
  // Ask the model for a bare JSON object where the provider supports it.
  bool        json_output = false;

  util::Deadline deadline;
};

/*
  Narrow capability interface over a language model. Implementations
  throw util::ProviderError on transport or protocol failures and
  util::DeadlineExceeded when the deadline runs out.
*/
class LanguageModelProvider {
 public:
  virtual ~LanguageModelProvider() = default;

  virtual std::string Complete(const std::string& prompt, const CompletionOptions& options) = 0;

  // Label used in logs and metrics.
  virtual std::string Name() const = 0;
};

} // namespace tracebrain::llm
