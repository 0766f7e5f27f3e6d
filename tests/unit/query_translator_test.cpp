#include "internal/query/query_translator.hpp"

#include <cassert>
#include <chrono>
#include <deque>
#include <iostream>
#include <memory>
#include <string>

#include "internal/llm/json_reply.hpp"
#include "internal/util/errors.hpp"

namespace {

using tracebrain::query::QueryTranslator;
using tracebrain::query::TranslatorOptions;
namespace v1   = tracebrain::query::v1;
namespace util = tracebrain::util;

// Replays canned replies; an empty reply string raises ProviderError.
class ScriptedProvider : public tracebrain::llm::LanguageModelProvider {
 public:
  explicit ScriptedProvider(std::deque<std::string> replies) : replies_(std::move(replies)) {
  }

  std::string Complete(const std::string& prompt, const tracebrain::llm::CompletionOptions& options) override {
    ++calls;
    last_prompt = prompt;
    assert(options.json_output);
    if (replies_.empty()) {
      throw util::ProviderError("script exhausted");
    }
    auto reply = replies_.front();
    if (replies_.size() > 1) {
      replies_.pop_front();
    }
    if (reply.empty()) {
      throw util::ProviderError("connection refused");
    }
    return reply;
  }

  std::string Name() const override {
    return "scripted";
  }

  int         calls = 0;
  std::string last_prompt;

 private:
  std::deque<std::string> replies_;
};

TranslatorOptions FastRetries(uint32_t retries) {
  TranslatorOptions options;
  options.retry.max_retries = retries;
  options.retry.backoff     = std::chrono::milliseconds(1);
  return options;
}

bool Rejected(const std::string& output) {
  try {
    QueryTranslator::Parse(output);
  } catch (const util::TranslationFailed&) {
    return true;
  }
  return false;
}

void TestParsesListTraces() {
  auto query = QueryTranslator::Parse(
      R"({"kind": "list_traces", "filter": {"status": "failed", "error_type": "tool_error", "min_rating": 2,
          "start_time": "2024-01-01T00:00:00Z", "system_prompt_contains": "support"}, "limit": 5})");

  assert(query.kind() == v1::QUERY_KIND_LIST_TRACES);
  assert(query.filter().status() == "failed");
  assert(query.filter().error_type() == "tool_error");
  assert(query.filter().has_min_rating() && query.filter().min_rating() == 2);
  assert(query.filter().has_start_time());
  assert(query.filter().system_prompt_contains() == "support");
  assert(query.limit() == 5);
}

void TestParsesOtherKinds() {
  auto get = QueryTranslator::Parse(R"({"kind": "get_trace", "trace_id": "abc"})");
  assert(get.kind() == v1::QUERY_KIND_GET_TRACE);
  assert(get.trace_id() == "abc");

  auto episode = QueryTranslator::Parse(R"({"kind": "episode_traces", "episode_id": "ep-9"})");
  assert(episode.episode_id() == "ep-9");

  auto episodes = QueryTranslator::Parse(R"({"kind": "list_episodes", "filter": {"max_confidence": 0.4}, "limit": 3})");
  assert(episodes.kind() == v1::QUERY_KIND_LIST_EPISODES);
  assert(episodes.filter().max_confidence() == 0.4);

  auto stats = QueryTranslator::Parse(R"({"kind": "trace_stats"})");
  assert(stats.kind() == v1::QUERY_KIND_TRACE_STATS);
}

void TestUnwrapsFencedReply() {
  auto query = QueryTranslator::Parse("```json\n{\"kind\": \"tool_usage\"}\n```");
  assert(query.kind() == v1::QUERY_KIND_TOOL_USAGE);

  assert(tracebrain::llm::ParseJsonReply("  {\"a\": 1}  ").has_value());
  assert(!tracebrain::llm::ParseJsonReply("Sure! {\"a\": 1}").has_value());
  assert(!tracebrain::llm::ParseJsonReply("[1, 2]").has_value());
}

void TestRejectsOutsideGrammar() {
  assert(Rejected("not json"));
  assert(Rejected(R"({"filter": {}})"));
  assert(Rejected(R"({"kind": "delete_traces"})"));
  assert(Rejected(R"({"kind": "list_traces", "order_by": "rating"})"));
  assert(Rejected(R"({"kind": "list_traces", "filter": {"status": "sleeping"}})"));
  assert(Rejected(R"({"kind": "list_traces", "filter": {"colour": "red"}})"));
  assert(Rejected(R"({"kind": "list_traces", "filter": {"min_rating": "3"}})"));
  assert(Rejected(R"({"kind": "list_traces", "filter": {"min_rating": 2.5}})"));
  assert(Rejected(R"({"kind": "list_traces", "filter": {"min_confidence": 0.9, "max_confidence": 0.1}})"));
  assert(Rejected(R"({"kind": "list_traces", "limit": 51})"));
  assert(Rejected(R"({"kind": "list_traces", "limit": 0})"));
  assert(Rejected(R"({"kind": "get_trace"})"));
  assert(Rejected(R"({"kind": "get_trace", "trace_id": "a", "limit": 3})"));
  assert(Rejected(R"({"kind": "trace_stats", "limit": 3})"));
  assert(Rejected(R"({"kind": "episode_traces"})"));
  assert(Rejected(R"({"kind": "list_episodes", "filter": {"status": "failed"}})"));
  assert(Rejected(R"({"kind": "list_traces", "filter": {"start_time": "yesterday"}})"));
}

void TestTranslateRetriesBadOutput() {
  auto provider = std::make_shared<ScriptedProvider>(std::deque<std::string>{"I think you want traces", R"({"kind": "trace_stats"})"});
  QueryTranslator translator(provider, FastRetries(2));

  auto query = translator.Translate("how are we doing?");
  assert(query.kind() == v1::QUERY_KIND_TRACE_STATS);
  assert(provider->calls == 2);
  assert(provider->last_prompt.find("how are we doing?") != std::string::npos);
}

void TestTranslateGivesUp() {
  auto provider = std::make_shared<ScriptedProvider>(std::deque<std::string>{R"({"kind": "nope"})"});
  QueryTranslator translator(provider, FastRetries(1));

  bool threw = false;
  try {
    translator.Translate("anything");
  } catch (const util::TranslationFailed&) {
    threw = true;
  }
  assert(threw);
  assert(provider->calls == 2);
}

void TestProviderErrorsBecomeTranslationFailures() {
  auto provider = std::make_shared<ScriptedProvider>(std::deque<std::string>{""});
  QueryTranslator translator(provider, FastRetries(0));

  bool threw = false;
  try {
    translator.Translate("anything");
  } catch (const util::TranslationFailed& e) {
    threw = std::string(e.what()).find("connection refused") != std::string::npos;
  }
  assert(threw);
}

void TestTranslateRequiresQuestionAndProvider() {
  QueryTranslator without_provider(nullptr);
  bool            threw = false;
  try {
    without_provider.Translate("list failures");
  } catch (const util::TranslationFailed&) {
    threw = true;
  }
  assert(threw);

  auto            provider = std::make_shared<ScriptedProvider>(std::deque<std::string>{R"({"kind": "trace_stats"})"});
  QueryTranslator translator(provider, FastRetries(0));
  threw = false;
  try {
    translator.Translate("   ");
  } catch (const util::ValidationError&) {
    threw = true;
  }
  assert(threw);
  assert(provider->calls == 0);
}

void TestExpiredDeadline() {
  auto            provider = std::make_shared<ScriptedProvider>(std::deque<std::string>{R"({"kind": "trace_stats"})"});
  QueryTranslator translator(provider, FastRetries(0));

  bool threw = false;
  try {
    translator.Translate("stats", util::Deadline(std::chrono::steady_clock::now() - std::chrono::milliseconds(1)));
  } catch (const util::DeadlineExceeded&) {
    threw = true;
  }
  assert(threw);
  assert(provider->calls == 0);
}

} // namespace

int main() {
  TestParsesListTraces();
  TestParsesOtherKinds();
  TestUnwrapsFencedReply();
  TestRejectsOutsideGrammar();
  TestTranslateRetriesBadOutput();
  TestTranslateGivesUp();
  TestProviderErrorsBecomeTranslationFailures();
  TestTranslateRequiresQuestionAndProvider();
  TestExpiredDeadline();

  std::cout << "tracebrain_unit_query_translator: pass\n";
  return 0;
}
