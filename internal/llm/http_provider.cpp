#include "http_provider.hpp"

#include <httplib.h>

#include <algorithm>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace tracebrain::llm {

using google::protobuf::Struct;
using google::protobuf::Value;

namespace {

constexpr const char* kAnthropicVersion   = "2023-06-01";
constexpr uint32_t    kAnthropicMaxTokens = 1024;

Value Text(const std::string& text) {
  Value value;
  value.set_string_value(text);
  return value;
}

Value Message(const std::string& role, const std::string& content) {
  Value value;
  auto& fields      = *value.mutable_struct_value()->mutable_fields();
  fields["role"]    = Text(role);
  fields["content"]  = Text(content);
  return value;
}

const Value* Get(const Struct& object, const char* key) {
  auto it = object.fields().find(key);
  return it == object.fields().end() ? nullptr : &it->second;
}

const Struct* GetObject(const Struct& object, const char* key) {
  const auto* value = Get(object, key);
  return value && value->kind_case() == Value::kStructValue ? &value->struct_value() : nullptr;
}

const Struct* FirstObject(const Struct& object, const char* key) {
  const auto* value = Get(object, key);
  if (!value || value->kind_case() != Value::kListValue || value->list_value().values_size() == 0) {
    return nullptr;
  }
  const auto& first = value->list_value().values(0);
  return first.kind_case() == Value::kStructValue ? &first.struct_value() : nullptr;
}

const std::string* GetString(const Struct* object, const char* key) {
  if (!object) {
    return nullptr;
  }
  const auto* value = Get(*object, key);
  return value && value->kind_case() == Value::kStringValue ? &value->string_value() : nullptr;
}

Value TextParts(const std::string& text) {
  Value part;
  (*part.mutable_struct_value()->mutable_fields())["text"] = Text(text);

  Value content;
  *(*content.mutable_struct_value()->mutable_fields())["parts"].mutable_list_value()->add_values() = std::move(part);
  return content;
}

// Flat prompt for text-generation endpoints without a chat format.
std::string Transcript(const std::string& system, const std::string& prompt) {
  std::string text;
  if (!system.empty()) {
    text = system + "\n\n";
  }
  return text + "User: " + prompt + "\nAssistant:";
}

std::string_view FlavorName(ApiFlavor flavor) {
  switch (flavor) {
    case ApiFlavor::kOllama:
      return "ollama";
    case ApiFlavor::kOpenAi:
      return "openai";
    case ApiFlavor::kAzureOpenAi:
      return "azure_openai";
    case ApiFlavor::kAnthropic:
      return "anthropic";
    case ApiFlavor::kGemini:
      return "gemini";
    case ApiFlavor::kHuggingFace:
      return "huggingface";
  }
  return "unknown";
}

std::string WithV1(const std::string& prefix, const std::string& rest) {
  return prefix + (prefix.ends_with("/v1") ? rest : "/v1" + rest);
}

} // namespace

HttpChatProvider::HttpChatProvider(HttpProviderOptions options) : options_(std::move(options)) {
  if (options_.base_url.empty()) {
    throw std::invalid_argument("llm base_url is required");
  }
  if (options_.model.empty()) {
    throw std::invalid_argument("llm model is required");
  }
  if (options_.flavor == ApiFlavor::kAzureOpenAi && options_.api_version.empty()) {
    throw std::invalid_argument("llm api_version is required for azure_openai");
  }

  // split "https://host:port/prefix" into origin and path prefix
  const auto scheme_end = options_.base_url.find("://");
  const auto path_start = options_.base_url.find('/', scheme_end == std::string::npos ? 0 : scheme_end + 3);
  origin_               = options_.base_url.substr(0, path_start);
  if (path_start != std::string::npos) {
    path_prefix_ = options_.base_url.substr(path_start);
    while (!path_prefix_.empty() && path_prefix_.back() == '/') {
      path_prefix_.pop_back();
    }
  }
}

std::string HttpChatProvider::Name() const {
  return std::string(FlavorName(options_.flavor));
}

std::string HttpChatProvider::BuildBody(const std::string& prompt, const std::string& model, const CompletionOptions& options) const {
  Struct body;
  auto&  fields = *body.mutable_fields();

  Value messages;
  auto* list = messages.mutable_list_value();

  switch (options_.flavor) {
    case ApiFlavor::kOllama: {
      fields["model"] = Text(model);
      if (!options.system.empty()) {
        *list->add_values() = Message("system", options.system);
      }
      *list->add_values() = Message("user", prompt);
      fields["messages"]  = std::move(messages);
      fields["stream"].set_bool_value(false);

      auto& model_options = *fields["options"].mutable_struct_value()->mutable_fields();
      model_options["temperature"].set_number_value(options.temperature);
      if (options.max_tokens > 0) {
        model_options["num_predict"].set_number_value(options.max_tokens);
      }
      if (options.json_output) {
        fields["format"] = Text("json");
      }
      break;
    }
    case ApiFlavor::kOpenAi:
    case ApiFlavor::kAzureOpenAi: {
      // azure routes by deployment in the path
      if (options_.flavor == ApiFlavor::kOpenAi) {
        fields["model"] = Text(model);
      }
      if (!options.system.empty()) {
        *list->add_values() = Message("system", options.system);
      }
      *list->add_values() = Message("user", prompt);
      fields["messages"]  = std::move(messages);
      fields["temperature"].set_number_value(options.temperature);
      if (options.max_tokens > 0) {
        fields["max_tokens"].set_number_value(options.max_tokens);
      }
      if (options.json_output) {
        (*fields["response_format"].mutable_struct_value()->mutable_fields())["type"] = Text("json_object");
      }
      break;
    }
    case ApiFlavor::kAnthropic: {
      fields["model"]     = Text(model);
      *list->add_values() = Message("user", prompt);
      fields["messages"]  = std::move(messages);
      if (!options.system.empty()) {
        fields["system"] = Text(options.system);
      }
      fields["temperature"].set_number_value(options.temperature);
      fields["max_tokens"].set_number_value(options.max_tokens > 0 ? options.max_tokens : kAnthropicMaxTokens);
      break;
    }
    case ApiFlavor::kGemini: {
      Value turn = TextParts(prompt);
      (*turn.mutable_struct_value()->mutable_fields())["role"] = Text("user");
      *list->add_values()                                     = std::move(turn);
      fields["contents"]                                      = std::move(messages);
      if (!options.system.empty()) {
        fields["systemInstruction"] = TextParts(options.system);
      }

      auto& generation = *fields["generationConfig"].mutable_struct_value()->mutable_fields();
      generation["temperature"].set_number_value(options.temperature);
      if (options.max_tokens > 0) {
        generation["maxOutputTokens"].set_number_value(options.max_tokens);
      }
      if (options.json_output) {
        generation["responseMimeType"] = Text("application/json");
      }
      break;
    }
    case ApiFlavor::kHuggingFace: {
      fields["inputs"] = Text(Transcript(options.system, prompt));

      auto& parameters = *fields["parameters"].mutable_struct_value()->mutable_fields();
      // the inference API rejects a zero temperature
      if (options.temperature > 0.0) {
        parameters["temperature"].set_number_value(options.temperature);
      }
      if (options.max_tokens > 0) {
        parameters["max_new_tokens"].set_number_value(options.max_tokens);
      }
      parameters["return_full_text"].set_bool_value(false);
      break;
    }
  }
  return util::StructToJson(body);
}

HttpRequest HttpChatProvider::BuildRequest(const std::string& prompt, const CompletionOptions& options) const {
  const auto& model = options.model.empty() ? options_.model : options.model;

  HttpRequest request;
  switch (options_.flavor) {
    case ApiFlavor::kOllama:
      request.path = path_prefix_ + "/api/chat";
      break;
    case ApiFlavor::kOpenAi:
      request.path = WithV1(path_prefix_, "/chat/completions");
      if (!options_.api_key.empty()) {
        request.headers.emplace_back("Authorization", "Bearer " + options_.api_key);
      }
      break;
    case ApiFlavor::kAzureOpenAi:
      request.path = path_prefix_ + "/openai/deployments/" + model + "/chat/completions?api-version=" + options_.api_version;
      request.headers.emplace_back("api-key", options_.api_key);
      break;
    case ApiFlavor::kAnthropic:
      request.path = WithV1(path_prefix_, "/messages");
      request.headers.emplace_back("x-api-key", options_.api_key);
      request.headers.emplace_back("anthropic-version", kAnthropicVersion);
      break;
    case ApiFlavor::kGemini:
      request.path = path_prefix_ + "/v1beta/models/" + model + ":generateContent";
      request.headers.emplace_back("x-goog-api-key", options_.api_key);
      break;
    case ApiFlavor::kHuggingFace:
      request.path = path_prefix_ + "/models/" + model;
      if (!options_.api_key.empty()) {
        request.headers.emplace_back("Authorization", "Bearer " + options_.api_key);
      }
      break;
  }
  request.body = BuildBody(prompt, model, options);
  return request;
}

std::string HttpChatProvider::ExtractText(const std::string& body) const {
  Value response;
  try {
    util::JsonToMessage(body, &response, false);
  } catch (const std::runtime_error& e) {
    throw util::ProviderError(Name() + " returned a non-JSON body: " + e.what());
  }

  const std::string* text = nullptr;
  if (options_.flavor == ApiFlavor::kHuggingFace) {
    // either [{"generated_text": ...}] or {"generated_text": ...}
    const Struct* object = nullptr;
    if (response.kind_case() == Value::kListValue && response.list_value().values_size() > 0 &&
        response.list_value().values(0).kind_case() == Value::kStructValue) {
      object = &response.list_value().values(0).struct_value();
    } else if (response.kind_case() == Value::kStructValue) {
      object = &response.struct_value();
    }
    text = GetString(object, "generated_text");
  } else if (response.kind_case() == Value::kStructValue) {
    const auto& root = response.struct_value();
    switch (options_.flavor) {
      case ApiFlavor::kOllama:
        text = GetString(GetObject(root, "message"), "content");
        break;
      case ApiFlavor::kOpenAi:
      case ApiFlavor::kAzureOpenAi: {
        const auto* choice = FirstObject(root, "choices");
        text               = GetString(choice ? GetObject(*choice, "message") : nullptr, "content");
        break;
      }
      case ApiFlavor::kAnthropic:
        text = GetString(FirstObject(root, "content"), "text");
        break;
      case ApiFlavor::kGemini: {
        const auto* candidate = FirstObject(root, "candidates");
        const auto* content   = candidate ? GetObject(*candidate, "content") : nullptr;
        text                  = GetString(content ? FirstObject(*content, "parts") : nullptr, "text");
        break;
      }
      case ApiFlavor::kHuggingFace:
        break;
    }
  }
  if (!text) {
    throw util::ProviderError(Name() + " response carries no completion text");
  }
  return *text;
}

std::string HttpChatProvider::Complete(const std::string& prompt, const CompletionOptions& options) {
  observability::SpanScope scope("llm.Complete");
  scope.SetAttribute("provider", Name());

  auto timeout = options_.timeout;
  if (auto remaining = options.deadline.Remaining()) {
    if (remaining->count() == 0) {
      throw util::DeadlineExceeded("deadline exceeded before calling " + Name());
    }
    timeout = std::min(timeout, *remaining);
  }

  httplib::Client cli(origin_);
  cli.set_connection_timeout(timeout);
  cli.set_read_timeout(timeout);
  cli.set_write_timeout(timeout);

  auto             request = BuildRequest(prompt, options);
  httplib::Headers headers;
  for (const auto& [name, value] : request.headers) {
    headers.emplace(name, value);
  }

  auto res = cli.Post(request.path, headers, request.body, "application/json");
  if (!res) {
    observability::Metrics::Instance().RecordProviderCall(Name(), false);
    if (options.deadline.Expired()) {
      throw util::DeadlineExceeded(Name() + " call exceeded the deadline");
    }
    throw util::ProviderError(Name() + " request failed: " + httplib::to_string(res.error()));
  }
  if (res->status != 200) {
    observability::Metrics::Instance().RecordProviderCall(Name(), false);
    TRACEBRAIN_LOG_WARN("model provider returned an error", {observability::StringField("provider", Name()),
                                                             observability::IntField("status", res->status)});
    throw util::ProviderError(Name() + " returned HTTP " + std::to_string(res->status) + ": " + res->body);
  }

  auto text = ExtractText(res->body);
  observability::Metrics::Instance().RecordProviderCall(Name(), true);
  return text;
}

} // namespace tracebrain::llm
