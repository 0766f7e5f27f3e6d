#include "internal/llm/http_provider.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/llm/provider_factory.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;
using tracebrain::llm::ApiFlavor;
using tracebrain::llm::CompletionOptions;
using tracebrain::llm::HttpChatProvider;
using tracebrain::llm::HttpProviderOptions;
using tracebrain::llm::HttpRequest;
namespace config = tracebrain::runtime::config;
namespace util   = tracebrain::util;

HttpChatProvider Make(ApiFlavor flavor, const std::string& base_url, const std::string& model, const std::string& api_version = {}) {
  HttpProviderOptions options;
  options.flavor      = flavor;
  options.base_url    = base_url;
  options.model       = model;
  options.api_key     = "secret";
  options.api_version = api_version;
  return HttpChatProvider(options);
}

std::string Header(const HttpRequest& request, const std::string& name) {
  for (const auto& [key, value] : request.headers) {
    if (key == name) {
      return value;
    }
  }
  return {};
}

const Value& Field(const Struct& object, const std::string& key) {
  auto it = object.fields().find(key);
  assert(it != object.fields().end());
  return it->second;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestRequestedModelReplacesConfiguredOne() {
  auto provider = Make(ApiFlavor::kOpenAi, "https://api.openai.com", "configured-model");

  CompletionOptions options;
  auto              plain = util::JsonToStruct(provider.BuildRequest("hi", options).body);
  assert(Field(plain, "model").string_value() == "configured-model");

  options.model   = "gpt-4o";
  auto request    = provider.BuildRequest("hi", options);
  auto overridden = util::JsonToStruct(request.body);
  assert(Field(overridden, "model").string_value() == "gpt-4o");
  assert(request.path == "/v1/chat/completions");
  assert(Header(request, "Authorization") == "Bearer secret");

  auto ollama = Make(ApiFlavor::kOllama, "http://localhost:11434", "llama3.1");
  options.json_output = true;
  auto body           = util::JsonToStruct(ollama.BuildRequest("hi", options).body);
  assert(Field(body, "model").string_value() == "gpt-4o");
  assert(Field(body, "format").string_value() == "json");
}

void TestAzureRoutesByDeployment() {
  assert(Throws<std::invalid_argument>([] { Make(ApiFlavor::kAzureOpenAi, "https://res.openai.azure.com", "prod-gpt4"); }));

  auto provider = Make(ApiFlavor::kAzureOpenAi, "https://res.openai.azure.com/", "prod-gpt4", "2024-06-01");
  assert(provider.Name() == "azure_openai");
  assert(provider.Origin() == "https://res.openai.azure.com");

  CompletionOptions options;
  options.system     = "be brief";
  options.max_tokens = 64;
  auto request       = provider.BuildRequest("hi", options);
  assert(request.path == "/openai/deployments/prod-gpt4/chat/completions?api-version=2024-06-01");
  assert(Header(request, "api-key") == "secret");
  assert(Header(request, "Authorization").empty());

  auto body = util::JsonToStruct(request.body);
  assert(!body.fields().contains("model"));
  assert(Field(body, "messages").list_value().values_size() == 2);
  assert(Field(body, "max_tokens").number_value() == 64);

  options.model = "eval-gpt4";
  assert(provider.BuildRequest("hi", options).path == "/openai/deployments/eval-gpt4/chat/completions?api-version=2024-06-01");

  auto reply = R"({"choices":[{"message":{"role":"assistant","content":"ok"}}]})";
  assert(provider.ExtractText(reply) == "ok");
}

void TestGeminiRequestShape() {
  auto provider = Make(ApiFlavor::kGemini, "https://generativelanguage.googleapis.com", "gemini-1.5-flash");

  CompletionOptions options;
  options.system      = "grade it";
  options.max_tokens  = 256;
  options.json_output = true;
  auto request        = provider.BuildRequest("the transcript", options);
  assert(request.path == "/v1beta/models/gemini-1.5-flash:generateContent");
  assert(Header(request, "x-goog-api-key") == "secret");

  auto        body     = util::JsonToStruct(request.body);
  const auto& contents = Field(body, "contents").list_value();
  assert(contents.values_size() == 1);
  const auto& turn = contents.values(0).struct_value();
  assert(Field(turn, "role").string_value() == "user");
  assert(Field(Field(turn, "parts").list_value().values(0).struct_value(), "text").string_value() == "the transcript");

  const auto& system = Field(body, "systemInstruction").struct_value();
  assert(Field(Field(system, "parts").list_value().values(0).struct_value(), "text").string_value() == "grade it");

  const auto& generation = Field(body, "generationConfig").struct_value();
  assert(Field(generation, "maxOutputTokens").number_value() == 256);
  assert(Field(generation, "responseMimeType").string_value() == "application/json");

  auto reply = R"({"candidates":[{"content":{"role":"model","parts":[{"text":"{\"rating\":5}"}]}}]})";
  assert(provider.ExtractText(reply) == R"({"rating":5})");
  assert(Throws<util::ProviderError>([&] { provider.ExtractText(R"({"candidates":[]})"); }));
}

void TestHuggingFaceRequestShape() {
  auto provider = Make(ApiFlavor::kHuggingFace, "https://api-inference.huggingface.co", "mistralai/Mistral-7B-Instruct");

  CompletionOptions options;
  options.system     = "You answer questions.";
  options.max_tokens = 128;
  auto request       = provider.BuildRequest("What is 2+2?", options);
  assert(request.path == "/models/mistralai/Mistral-7B-Instruct");
  assert(Header(request, "Authorization") == "Bearer secret");

  auto body = util::JsonToStruct(request.body);
  assert(Field(body, "inputs").string_value() == "You answer questions.\n\nUser: What is 2+2?\nAssistant:");
  const auto& parameters = Field(body, "parameters").struct_value();
  assert(Field(parameters, "max_new_tokens").number_value() == 128);
  assert(!parameters.fields().contains("temperature"));
  assert(!Field(parameters, "return_full_text").bool_value());

  assert(provider.ExtractText(R"([{"generated_text":" 4"}])") == " 4");
  assert(provider.ExtractText(R"({"generated_text":"four"})") == "four");
  assert(Throws<util::ProviderError>([&] { provider.ExtractText("[]"); }));
  assert(Throws<util::ProviderError>([&] { provider.ExtractText("<html>"); }));
}

void TestFactoryChecksProviderSettings() {
  config::LlmConfig llm;
  llm.set_provider(config::LLM_PROVIDER_AZURE_OPENAI);
  llm.set_model("prod-gpt4");
  llm.set_api_key("secret");
  llm.set_base_url("https://res.openai.azure.com");
  assert(Throws<std::runtime_error>([&] { tracebrain::llm::MakeProvider(llm); }));
  llm.set_api_version("2024-06-01");
  assert(tracebrain::llm::MakeProvider(llm)->Name() == "azure_openai");

  config::LlmConfig gemini;
  gemini.set_provider(config::LLM_PROVIDER_GEMINI);
  gemini.set_model("gemini-1.5-flash");
  assert(Throws<std::runtime_error>([&] { tracebrain::llm::MakeProvider(gemini); }));
  gemini.set_api_key("secret");
  assert(tracebrain::llm::MakeProvider(gemini)->Name() == "gemini");

  config::LlmConfig hf;
  hf.set_provider(config::LLM_PROVIDER_HUGGINGFACE);
  hf.set_model("gpt2");
  assert(tracebrain::llm::MakeProvider(hf)->Name() == "huggingface");
}

} // namespace

int main() {
  TestRequestedModelReplacesConfiguredOne();
  TestAzureRoutesByDeployment();
  TestGeminiRequestShape();
  TestHuggingFaceRequestShape();
  TestFactoryChecksProviderSettings();

  std::cout << "tracebrain_unit_http_provider: pass\n";
  return 0;
}
