#include "provider_factory.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

#if TRACEBRAIN_WITH_HTTP_LLM
#include "internal/llm/http_provider.hpp"
#endif

namespace tracebrain::llm {

using tracebrain::runtime::config::LlmConfig;
using tracebrain::runtime::config::LlmProvider;

#if TRACEBRAIN_WITH_HTTP_LLM
namespace {

std::string ResolveApiKey(const LlmConfig& config) {
  if (!config.api_key().empty()) {
    return config.api_key();
  }
  if (config.api_key_env().empty()) {
    return {};
  }
  const char* value = std::getenv(config.api_key_env().c_str());
  if (!value || !*value) {
    throw std::runtime_error("environment variable " + config.api_key_env() + " named by llm.api_key_env is not set");
  }
  return value;
}

} // namespace
#endif

std::shared_ptr<LanguageModelProvider> MakeProvider(const LlmConfig& config) {
  if (config.provider() == tracebrain::runtime::config::LLM_PROVIDER_UNSPECIFIED) {
    return nullptr;
  }
  if (config.model().empty()) {
    throw std::runtime_error("llm.model is required when a provider is configured");
  }

#if TRACEBRAIN_WITH_HTTP_LLM
  HttpProviderOptions options;
  options.model       = config.model();
  options.base_url    = config.base_url();
  options.api_key     = ResolveApiKey(config);
  options.api_version = config.api_version();
  options.timeout     = util::ToMillis(config.timeout(), std::chrono::milliseconds(60000));

  switch (config.provider()) {
    case tracebrain::runtime::config::LLM_PROVIDER_OLLAMA:
      options.flavor = ApiFlavor::kOllama;
      if (options.base_url.empty()) options.base_url = "http://localhost:11434";
      break;
    case tracebrain::runtime::config::LLM_PROVIDER_OPENAI:
      options.flavor = ApiFlavor::kOpenAi;
      if (options.base_url.empty()) options.base_url = "https://api.openai.com";
      if (options.api_key.empty()) throw std::runtime_error("llm.api_key or llm.api_key_env is required for openai");
      break;
    case tracebrain::runtime::config::LLM_PROVIDER_OPENAI_COMPATIBLE:
      options.flavor = ApiFlavor::kOpenAi;
      if (options.base_url.empty()) throw std::runtime_error("llm.base_url is required for openai_compatible");
      break;
    case tracebrain::runtime::config::LLM_PROVIDER_ANTHROPIC:
      options.flavor = ApiFlavor::kAnthropic;
      if (options.base_url.empty()) options.base_url = "https://api.anthropic.com";
      if (options.api_key.empty()) throw std::runtime_error("llm.api_key or llm.api_key_env is required for anthropic");
      break;
    case tracebrain::runtime::config::LLM_PROVIDER_AZURE_OPENAI:
      options.flavor = ApiFlavor::kAzureOpenAi;
      if (options.base_url.empty() || options.api_version.empty()) {
        throw std::runtime_error("llm.base_url and llm.api_version are required for azure_openai");
      }
      if (options.api_key.empty()) throw std::runtime_error("llm.api_key or llm.api_key_env is required for azure_openai");
      break;
    case tracebrain::runtime::config::LLM_PROVIDER_GEMINI:
      options.flavor = ApiFlavor::kGemini;
      if (options.base_url.empty()) options.base_url = "https://generativelanguage.googleapis.com";
      if (options.api_key.empty()) throw std::runtime_error("llm.api_key or llm.api_key_env is required for gemini");
      break;
    case tracebrain::runtime::config::LLM_PROVIDER_HUGGINGFACE:
      options.flavor = ApiFlavor::kHuggingFace;
      if (options.base_url.empty()) options.base_url = "https://api-inference.huggingface.co";
      break;
    default:
      throw std::runtime_error("unsupported llm provider: " + LlmProvider_Name(config.provider()));
  }

  TRACEBRAIN_LOG_INFO("language model provider configured", {observability::StringField("provider", LlmProvider_Name(config.provider())),
                                                             observability::StringField("model", options.model),
                                                             observability::StringField("base_url", options.base_url)});
  return std::make_shared<HttpChatProvider>(std::move(options));
#else
  throw std::runtime_error("llm provider " + LlmProvider_Name(config.provider()) + " requested but HTTP support is not enabled at build time");
#endif
}

} // namespace tracebrain::llm
