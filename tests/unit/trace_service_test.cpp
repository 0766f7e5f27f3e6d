#include "internal/service/trace_service.hpp"

#include <cassert>
#include <deque>
#include <iostream>
#include <memory>
#include <string>

#include "internal/analytics/analytics_engine.hpp"
#include "internal/core/trace_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/evaluation/evaluation_scheduler.hpp"
#include "internal/query/query_executor.hpp"
#include "internal/query/query_translator.hpp"
#include "internal/schema/attribute_keys.hpp"
#include "internal/util/errors.hpp"

namespace {

using tracebrain::service::ServiceContext;
using tracebrain::service::TraceService;
namespace v1   = tracebrain::v1;
namespace keys = tracebrain::schema::keys;
namespace util = tracebrain::util;

class CannedProvider : public tracebrain::llm::LanguageModelProvider {
 public:
  explicit CannedProvider(std::string reply) : reply_(std::move(reply)) {
  }

  std::string Complete(const std::string&, const tracebrain::llm::CompletionOptions&) override {
    return reply_;
  }

  std::string Name() const override {
    return "canned";
  }

 private:
  std::string reply_;
};

ServiceContext MakeContext(bool with_evaluation, const std::string& model_reply = R"({"kind": "trace_stats"})") {
  ServiceContext ctx;
  ctx.store      = std::make_shared<tracebrain::core::TraceStore>(std::make_shared<tracebrain::db::memory::MemoryRepository>());
  ctx.analytics  = std::make_shared<tracebrain::analytics::AnalyticsEngine>(ctx.store);
  ctx.translator = std::make_shared<tracebrain::query::QueryTranslator>(std::make_shared<CannedProvider>(model_reply));
  ctx.executor   = std::make_shared<tracebrain::query::QueryExecutor>(ctx.store, ctx.analytics);
  if (with_evaluation) {
    ctx.evaluations = std::make_shared<tracebrain::evaluation::EvaluationScheduler>();
  }
  ctx.default_limit = 2;
  ctx.max_limit     = 3;
  return ctx;
}

v1::IngestTraceRequest MakeTrace(const std::string& trace_id, const std::string& episode = {}) {
  v1::IngestTraceRequest req;
  req.set_trace_id(trace_id);

  auto* root = req.add_spans();
  root->set_span_id("root");
  (*root->mutable_attributes()->mutable_fields())[keys::SPAN_TYPE].set_string_value("user_request");
  (*root->mutable_attributes()->mutable_fields())[keys::LLM_NEW_CONTENT].set_string_value("Hi. ");

  auto* reply = req.add_spans();
  reply->set_span_id("reply");
  reply->set_parent_id("root");
  (*reply->mutable_attributes()->mutable_fields())[keys::SPAN_TYPE].set_string_value("llm_inference");
  (*reply->mutable_attributes()->mutable_fields())[keys::LLM_NEW_CONTENT].set_string_value("Hello!");

  auto& attrs = *req.mutable_attributes()->mutable_fields();
  attrs[keys::TRACE_STATUS].set_string_value("completed");
  if (!episode.empty()) {
    attrs[keys::EPISODE_ID].set_string_value(episode);
  }
  return req;
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

void TestIngestGetAndReconstruct() {
  TraceService service(MakeContext(false));

  auto ingested = service.Ingest(MakeTrace("t1"));
  assert(ingested.spans_added() == 2);
  assert(ingested.spans_skipped() == 0);

  auto again = service.Ingest(MakeTrace("t1"));
  assert(again.spans_added() == 0);
  assert(again.spans_skipped() == 2);

  v1::GetTraceRequest get;
  get.set_trace_id("t1");
  assert(service.Get(get).spans_size() == 2);

  v1::ReconstructSpanRequest reconstruct;
  reconstruct.set_trace_id("t1");
  reconstruct.set_span_id("reply");
  auto content = service.Reconstruct(reconstruct);
  assert(content.content() == "Hi. Hello!");
  assert(content.path_size() == 2);
  assert(content.path(0) == "root");

  get.set_trace_id("missing");
  assert(Throws<util::NotFound>([&] { service.Get(get); }));
  assert(Throws<util::ValidationError>([&] { service.Ingest(v1::IngestTraceRequest{}); }));
}

void TestListLimitNormalization() {
  TraceService service(MakeContext(false));
  for (const auto* id : {"a", "b", "c", "d", "e"}) {
    service.Ingest(MakeTrace(id));
  }

  v1::ListTracesRequest req;
  auto                  page = service.List(req);
  assert(page.traces_size() == 2);
  assert(page.total() == 5);

  req.set_limit(50);
  assert(service.List(req).traces_size() == 3);

  req.set_limit(-1);
  assert(Throws<util::ValidationError>([&] { service.List(req); }));
}

void TestFeedbackAndReviewQueue() {
  TraceService service(MakeContext(false));
  service.Ingest(MakeTrace("t1"));

  v1::AddFeedbackRequest feedback;
  feedback.set_trace_id("t1");
  assert(Throws<util::ValidationError>([&] { service.AddFeedback(feedback); }));

  feedback.mutable_feedback()->set_rating(5);
  feedback.mutable_feedback()->set_comment("great");
  assert(service.AddFeedback(feedback).feedbacks_size() == 1);

  v1::SignalTraceRequest signal;
  signal.set_trace_id("t1");
  signal.set_reason("looks wrong");
  assert(service.Signal(signal).signal().reason() == "looks wrong");

  auto queue = service.ReviewQueue(v1::ListReviewQueueRequest{});
  assert(queue.total() == 1);
  assert(queue.signals(0).trace_id() == "t1");
}

void TestEvaluateQueuesExistingTraces() {
  TraceService disabled(MakeContext(false));
  disabled.Ingest(MakeTrace("t1"));
  v1::EvaluateTraceRequest req;
  req.set_trace_id("t1");
  assert(Throws<util::ProviderError>([&] { disabled.Evaluate(req); }));

  auto         ctx       = MakeContext(true);
  auto         scheduler = ctx.evaluations;
  TraceService service(ctx);
  service.Ingest(MakeTrace("t1"));

  req.set_judge_model("judge-v2");
  auto resp = service.Evaluate(req);
  assert(resp.queued());
  assert(resp.trace_id() == "t1");
  assert(scheduler->Pending() == 1);

  req.set_trace_id("missing");
  assert(Throws<util::NotFound>([&] { service.Evaluate(req); }));
  assert(scheduler->Pending() == 1);

  auto task = scheduler->Dequeue();
  assert(task && task->trace_id == "t1" && task->judge_model == "judge-v2");

  scheduler->Shutdown();
  req.set_trace_id("t1");
  assert(Throws<util::ProviderError>([&] { service.Evaluate(req); }));
}

void TestEpisodesAndAnalytics() {
  TraceService service(MakeContext(false));
  service.Ingest(MakeTrace("t1", "ep"));
  service.Ingest(MakeTrace("t2", "ep"));
  service.Ingest(MakeTrace("t3"));

  v1::GetEpisodeTracesRequest episode;
  episode.set_episode_id("ep");
  auto traces = service.EpisodeTraces(episode);
  assert(traces.traces_size() == 2);
  assert(traces.summary().episode_id() == "ep");
  assert(traces.summary().trace_count() == 2);
  assert(!traces.summary().has_avg_confidence());

  episode.set_episode_id("");
  assert(Throws<util::ValidationError>([&] { service.EpisodeTraces(episode); }));

  auto episodes = service.ListEpisodes(v1::ListEpisodesRequest{});
  assert(episodes.total() == 1);

  auto stats = service.Stats(v1::GetStatsRequest{});
  assert(stats.trace_count() == 3);
  assert(stats.span_count() == 6);
  assert(stats.episode_count() == 1);
}

void TestNaturalLanguageQuery() {
  TraceService service(MakeContext(false));
  service.Ingest(MakeTrace("t1"));

  v1::NaturalLanguageQueryRequest req;
  assert(Throws<util::ValidationError>([&] { service.Query(req); }));

  req.set_question("How many traces are there?");
  auto answer = service.Query(req);
  assert(answer.query().kind() == v1::QUERY_KIND_TRACE_STATS);
  assert(!answer.answer().empty());

  TraceService confused(MakeContext(false, R"({"kind": "delete_everything"})"));
  assert(Throws<util::TranslationFailed>([&] { confused.Query(req); }));
}

} // namespace

int main() {
  TestIngestGetAndReconstruct();
  TestListLimitNormalization();
  TestFeedbackAndReviewQueue();
  TestEvaluateQueuesExistingTraces();
  TestEpisodesAndAnalytics();
  TestNaturalLanguageQuery();

  std::cout << "tracebrain_unit_trace_service: pass\n";
  return 0;
}
