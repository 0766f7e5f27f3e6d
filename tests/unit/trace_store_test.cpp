#include "internal/core/trace_store.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/schema/attribute_keys.hpp"
#include "internal/util/errors.hpp"

namespace {

using tracebrain::core::TraceStore;
using tracebrain::core::v1::Feedback;
using tracebrain::core::v1::Span;
using tracebrain::core::v1::Trace;
using tracebrain::query::v1::TraceFilter;
namespace keys = tracebrain::schema::keys;
namespace util = tracebrain::util;

std::shared_ptr<TraceStore> MakeStore() {
  return std::make_shared<TraceStore>(std::make_shared<tracebrain::db::memory::MemoryRepository>());
}

Span MakeSpan(const std::string& id, const std::string& parent, const std::string& type, const std::string& delta = {}) {
  Span span;
  span.set_span_id(id);
  span.set_parent_id(parent);
  span.set_name(type);
  span.mutable_start_time()->set_seconds(1700000000);
  span.mutable_end_time()->set_seconds(1700000001);
  auto& fields = *span.mutable_attributes()->mutable_fields();
  fields[keys::SPAN_TYPE].set_string_value(type);
  if (!delta.empty()) {
    fields[keys::LLM_NEW_CONTENT].set_string_value(delta);
  }
  return span;
}

google::protobuf::Struct TraceAttrs(const std::string& status, const std::string& episode = {}) {
  google::protobuf::Struct attrs;
  auto&                    fields = *attrs.mutable_fields();
  if (!status.empty()) {
    fields[keys::TRACE_STATUS].set_string_value(status);
  }
  if (!episode.empty()) {
    fields[keys::EPISODE_ID].set_string_value(episode);
  }
  return attrs;
}

const Span& SpanById(const Trace& trace, const std::string& id) {
  for (const auto& span : trace.spans()) {
    if (span.span_id() == id) {
      return span;
    }
  }
  assert(false && "span missing");
  return trace.spans(0);
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

void TestIngestReconstructsContent() {
  auto store = MakeStore();

  std::vector<Span> spans = {MakeSpan("root", "", "user_request", "Q: weather? "),
                             MakeSpan("llm-1", "root", "llm_inference", "Thinking. "),
                             MakeSpan("tool-1", "llm-1", "tool_execution")};
  (*spans[2].mutable_attributes()->mutable_fields())[keys::TOOL_NAME].set_string_value("weather_api");

  auto result = store->Ingest("t1", spans, TraceAttrs("running"), nullptr);
  assert(result.spans_added == 3);
  assert(result.spans_skipped == 0);
  assert(result.trace.spans_size() == 3);

  auto trace = store->Get("t1");
  assert(SpanById(trace, "root").content() == "Q: weather? ");
  assert(SpanById(trace, "llm-1").content() == "Q: weather? Thinking. ");
  assert(SpanById(trace, "tool-1").content() == "Q: weather? Thinking. ");

  // second batch extends an existing parent
  auto more = store->Ingest("t1", {MakeSpan("llm-2", "tool-1", "llm_inference", "Sunny.")}, {}, nullptr);
  assert(more.spans_added == 1);

  auto reconstruction = store->Reconstruct("t1", "llm-2");
  assert(reconstruction.content == "Q: weather? Thinking. Sunny.");
  assert(reconstruction.path == (std::vector<std::string>{"root", "llm-1", "tool-1", "llm-2"}));
}

void TestReingestIsIdempotent() {
  auto store = MakeStore();
  std::vector<Span> spans = {MakeSpan("a", "", "user_request", "x"), MakeSpan("b", "a", "llm_inference", "y")};

  store->Ingest("t", spans, TraceAttrs("running"), nullptr);
  auto again = store->Ingest("t", spans, {}, nullptr);
  assert(again.spans_added == 0);
  assert(again.spans_skipped == 2);
  assert(store->Get("t").spans_size() == 2);
}

void TestConflictingSpanLeavesTraceUntouched() {
  auto store = MakeStore();
  store->Ingest("t", {MakeSpan("a", "", "user_request", "x")}, TraceAttrs("running"), nullptr);

  auto changed = MakeSpan("a", "", "user_request", "different");
  assert(Throws<util::ConflictError>([&] { store->Ingest("t", {MakeSpan("n", "a", "llm_inference"), changed}, TraceAttrs("failed"), nullptr); }));

  auto trace = store->Get("t");
  assert(trace.spans_size() == 1);
  assert(SpanById(trace, "a").content() == "x");
  assert(trace.attributes().fields().at(keys::TRACE_STATUS).string_value() == "running");
}

void TestInvalidBatchesStoreNothing() {
  auto store = MakeStore();

  assert(Throws<util::DanglingParent>([&] { store->Ingest("t", {MakeSpan("a", "ghost", "llm_inference")}, {}, nullptr); }));
  assert(Throws<util::NotFound>([&] { store->Get("t"); }));

  assert(Throws<util::CycleDetected>(
      [&] { store->Ingest("t", {MakeSpan("a", "b", "llm_inference"), MakeSpan("b", "a", "llm_inference")}, {}, nullptr); }));
  assert(Throws<util::NotFound>([&] { store->Get("t"); }));

  auto bad = MakeSpan("a", "", "user_request");
  (*bad.mutable_attributes()->mutable_fields())[keys::SPAN_TYPE].set_string_value("bogus");
  assert(Throws<util::ValidationError>([&] { store->Ingest("t", {bad}, {}, nullptr); }));

  assert(Throws<util::ValidationError>([&] { store->Ingest("t", {}, TraceAttrs("sleeping"), nullptr); }));
  assert(Throws<util::NotFound>([&] { store->Get("t"); }));
}

void TestAttributesAreMerged() {
  auto store = MakeStore();
  store->Ingest("t", {}, TraceAttrs("running", "ep"), nullptr);
  auto trace = store->Ingest("t", {}, TraceAttrs("completed"), nullptr).trace;

  const auto& fields = trace.attributes().fields();
  assert(fields.at(keys::TRACE_STATUS).string_value() == "completed");
  assert(fields.at(keys::EPISODE_ID).string_value() == "ep");
}

void TestFeedbackIsAppendOnly() {
  auto store = MakeStore();

  Feedback first;
  first.set_rating(2);
  first.set_comment("meh");
  store->Ingest("t", {MakeSpan("a", "", "user_request")}, {}, &first);

  Feedback second;
  second.set_rating(5);
  auto trace = store->AddFeedback("t", second);
  assert(trace.feedbacks_size() == 2);
  assert(trace.feedbacks(0).rating() == 2);
  assert(trace.feedbacks(0).comment() == "meh");
  assert(trace.feedbacks(1).rating() == 5);
  assert(trace.feedbacks(1).has_timestamp());

  Feedback invalid;
  invalid.set_rating(9);
  assert(Throws<util::ValidationError>([&] { store->AddFeedback("t", invalid); }));
  assert(Throws<util::NotFound>([&] { store->AddFeedback("missing", second); }));
  assert(store->Get("t").feedbacks_size() == 2);
}

void TestListFiltersAndPaginates() {
  auto store = MakeStore();
  store->Ingest("a", {}, TraceAttrs("completed"), nullptr);
  std::this_thread::sleep_for(std::chrono::milliseconds(3));
  store->Ingest("b", {}, TraceAttrs("failed"), nullptr);
  std::this_thread::sleep_for(std::chrono::milliseconds(3));
  store->Ingest("c", {}, TraceAttrs("completed"), nullptr);
  std::this_thread::sleep_for(std::chrono::milliseconds(3));
  store->Ingest("d", {}, {}, nullptr);

  auto all = store->List(TraceFilter{}, 0, 10);
  assert(all.total == 4);
  assert(all.traces.size() == 4);
  assert(all.traces[0].trace_id() == "d");
  assert(all.traces[3].trace_id() == "a");

  TraceFilter completed;
  completed.set_status("completed");
  auto page = store->List(completed, 0, 1);
  assert(page.total == 2);
  assert(page.traces.size() == 1);
  assert(page.traces[0].trace_id() == "c");

  auto next = store->List(completed, 1, 1);
  assert(next.traces.size() == 1);
  assert(next.traces[0].trace_id() == "a");

  assert(store->List(completed, 5, 1).traces.empty());

  TraceFilter unknown;
  unknown.set_status("sleeping");
  assert(Throws<util::ValidationError>([&] { store->List(unknown, 0, 10); }));
  assert(Throws<util::ValidationError>([&] { store->List(TraceFilter{}, -1, 10); }));
}

void TestRatingAndConfidenceFilters() {
  auto store = MakeStore();
  store->Ingest("rated", {}, {}, nullptr);
  store->Ingest("judged", {}, {}, nullptr);
  store->Ingest("plain", {}, {}, nullptr);

  Feedback low;
  low.set_rating(5);
  store->AddFeedback("rated", low);
  low.set_rating(2);
  store->AddFeedback("rated", low);

  tracebrain::schema::Evaluation eval;
  eval.rating     = 4;
  eval.confidence = 0.3;
  eval.status     = "ok";
  store->SetEvaluation("judged", eval);

  TraceFilter min_rating;
  min_rating.set_min_rating(3);
  auto rated = store->List(min_rating, 0, 10);
  // the latest feedback (2) wins over the earlier 5
  assert(rated.total == 1);
  assert(rated.traces[0].trace_id() == "judged");

  TraceFilter low_confidence;
  low_confidence.set_max_confidence(0.5);
  auto uncertain = store->List(low_confidence, 0, 10);
  assert(uncertain.total == 1);
  assert(uncertain.traces[0].trace_id() == "judged");
}

void TestSignalsFeedReviewQueue() {
  auto store = MakeStore();
  store->Ingest("a", {}, TraceAttrs("completed"), nullptr);
  store->Ingest("b", {}, TraceAttrs("running"), nullptr);

  store->Signal("a", "wrong tool");
  store->Signal("b", "loops");

  assert(store->Get("a").attributes().fields().at(keys::TRACE_STATUS).string_value() == "needs_review");
  assert(store->Get("a").signals_size() == 1);

  auto queue = store->ListReviewQueue(0, 10);
  assert(queue.total == 2);
  assert(queue.signals[0].trace_id() == "b");
  assert(queue.signals[1].reason() == "wrong tool");

  assert(Throws<util::NotFound>([&] { store->Signal("missing", "x"); }));
  assert(Throws<util::ValidationError>([&] { store->Signal("a", ""); }));
}

void TestEpisodeTracesInCreationOrder() {
  auto store = MakeStore();
  store->Ingest("first", {}, TraceAttrs("completed", "ep-1"), nullptr);
  store->Ingest("other", {}, TraceAttrs("completed", "ep-2"), nullptr);
  store->Ingest("second", {}, TraceAttrs("failed", "ep-1"), nullptr);

  auto traces = store->EpisodeTraces("ep-1");
  assert(traces.size() == 2);
  assert(traces[0].trace_id() == "first");
  assert(traces[1].trace_id() == "second");

  assert(Throws<util::NotFound>([&] { store->EpisodeTraces("ep-404"); }));
}

void TestExpiredDeadlineWritesNothing() {
  auto       store   = MakeStore();
  const auto expired = util::Deadline(std::chrono::steady_clock::now() - std::chrono::milliseconds(1));

  assert(Throws<util::DeadlineExceeded>([&] { store->Ingest("t", {MakeSpan("a", "", "user_request")}, {}, nullptr, expired); }));
  assert(Throws<util::NotFound>([&] { store->Get("t"); }));
  assert(Throws<util::DeadlineExceeded>([&] { store->List(TraceFilter{}, 0, 10, expired); }));
}

} // namespace

int main() {
  TestIngestReconstructsContent();
  TestReingestIsIdempotent();
  TestConflictingSpanLeavesTraceUntouched();
  TestInvalidBatchesStoreNothing();
  TestAttributesAreMerged();
  TestFeedbackIsAppendOnly();
  TestListFiltersAndPaginates();
  TestRatingAndConfidenceFilters();
  TestSignalsFeedReviewQueue();
  TestEpisodeTracesInCreationOrder();
  TestExpiredDeadlineWritesNothing();

  std::cout << "tracebrain_unit_trace_store: pass\n";
  return 0;
}
