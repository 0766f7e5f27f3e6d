#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include "internal/llm/provider.hpp"

namespace tracebrain::llm {

enum class ApiFlavor {
  kOllama,       // POST /api/chat
  kOpenAi,       // POST /v1/chat/completions, also OpenAI-compatible servers
  kAzureOpenAi,  // POST /openai/deployments/{model}/chat/completions?api-version=
  kAnthropic,    // POST /v1/messages
  kGemini,       // POST /v1beta/models/{model}:generateContent
  kHuggingFace,  // POST /models/{model}
};

struct HttpProviderOptions {
  ApiFlavor   flavor = ApiFlavor::kOllama;
  // scheme://host[:port][/prefix]
  std::string base_url;
  std::string model;
  std::string api_key;
  std::string api_version;

  std::chrono::milliseconds timeout{60000};
};

struct HttpRequest {
  std::string                                      path;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string                                      body;
};

/*
  Chat-completion client for the supported HTTP APIs. One request per
  Complete() call; retries belong to the caller.
*/
class HttpChatProvider final : public LanguageModelProvider {
 public:
  explicit HttpChatProvider(HttpProviderOptions options);

  std::string Complete(const std::string& prompt, const CompletionOptions& options) override;

  std::string Name() const override;

  HttpRequest BuildRequest(const std::string& prompt, const CompletionOptions& options) const;

  // Throws util::ProviderError when the body carries no completion text.
  std::string ExtractText(const std::string& body) const;

  const std::string& Origin() const {
    return origin_;
  }

 private:
  std::string BuildBody(const std::string& prompt, const std::string& model, const CompletionOptions& options) const;

  HttpProviderOptions options_;
  std::string         origin_;
  std::string         path_prefix_;
};

} // namespace tracebrain::llm
