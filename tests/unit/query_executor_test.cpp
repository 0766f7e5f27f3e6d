#include "internal/query/query_executor.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/analytics/analytics_engine.hpp"
#include "internal/core/trace_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/schema/attribute_keys.hpp"
#include "internal/util/errors.hpp"

namespace {

using tracebrain::query::QueryExecutor;
namespace v1   = tracebrain::query::v1;
namespace keys = tracebrain::schema::keys;
namespace util = tracebrain::util;

struct Fixture {
  std::shared_ptr<tracebrain::core::TraceStore>           store;
  std::shared_ptr<tracebrain::analytics::AnalyticsEngine> analytics;
  std::shared_ptr<QueryExecutor>                          executor;
};

google::protobuf::Struct Attrs(const std::string& status, const std::string& episode) {
  google::protobuf::Struct attrs;
  (*attrs.mutable_fields())[keys::TRACE_STATUS].set_string_value(status);
  if (!episode.empty()) {
    (*attrs.mutable_fields())[keys::EPISODE_ID].set_string_value(episode);
  }
  return attrs;
}

tracebrain::core::v1::Span ToolSpan(const std::string& id, const std::string& tool) {
  tracebrain::core::v1::Span span;
  span.set_span_id(id);
  auto& fields = *span.mutable_attributes()->mutable_fields();
  fields[keys::SPAN_TYPE].set_string_value("tool_execution");
  fields[keys::TOOL_NAME].set_string_value(tool);
  return span;
}

Fixture MakeFixture() {
  Fixture f;
  f.store     = std::make_shared<tracebrain::core::TraceStore>(std::make_shared<tracebrain::db::memory::MemoryRepository>());
  f.analytics = std::make_shared<tracebrain::analytics::AnalyticsEngine>(f.store);
  f.executor  = std::make_shared<QueryExecutor>(f.store, f.analytics, 2);

  f.store->Ingest("ok-1", {ToolSpan("s", "search")}, Attrs("completed", "ep"), nullptr);
  f.store->Ingest("bad-1", {ToolSpan("s", "calc")}, Attrs("failed", "ep"), nullptr);
  f.store->Ingest("bad-2", {}, Attrs("failed", ""), nullptr);
  f.store->Ingest("bad-3", {}, Attrs("failed", ""), nullptr);
  return f;
}

void TestListTracesUsesDefaultLimit() {
  auto f = MakeFixture();

  v1::StructuredQuery query;
  query.set_kind(v1::QUERY_KIND_LIST_TRACES);
  query.mutable_filter()->set_status("failed");

  auto answer = f.executor->Execute(query);
  assert(answer.source_trace_ids_size() == 2);
  assert(answer.answer().find("Found 3 matching trace(s), showing 2.") == 0);
  assert(answer.query().kind() == v1::QUERY_KIND_LIST_TRACES);

  query.set_limit(10);
  assert(f.executor->Execute(query).source_trace_ids_size() == 3);
}

void TestGetTrace() {
  auto f = MakeFixture();

  v1::StructuredQuery query;
  query.set_kind(v1::QUERY_KIND_GET_TRACE);
  query.set_trace_id("ok-1");

  auto answer = f.executor->Execute(query);
  assert(answer.source_trace_ids_size() == 1);
  assert(answer.source_trace_ids(0) == "ok-1");
  assert(answer.answer().find("status completed") != std::string::npos);

  query.set_trace_id("missing");
  bool threw = false;
  try {
    f.executor->Execute(query);
  } catch (const util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestStatsAndToolUsageHonourFilter() {
  auto f = MakeFixture();

  v1::StructuredQuery stats;
  stats.set_kind(v1::QUERY_KIND_TRACE_STATS);
  stats.mutable_filter()->set_status("failed");
  auto answer = f.executor->Execute(stats);
  assert(answer.answer().find("3 trace(s)") == 0);
  assert(answer.answer().find("No evaluated traces.") != std::string::npos);
  assert(answer.source_trace_ids_size() == 3);

  v1::StructuredQuery tools;
  tools.set_kind(v1::QUERY_KIND_TOOL_USAGE);
  tools.mutable_filter()->set_status("completed");
  auto usage = f.executor->Execute(tools);
  assert(usage.answer().find("search: 1 call(s)") != std::string::npos);
  assert(usage.answer().find("calc") == std::string::npos);
}

void TestEpisodes() {
  auto f = MakeFixture();

  v1::StructuredQuery episode;
  episode.set_kind(v1::QUERY_KIND_EPISODE_TRACES);
  episode.set_episode_id("ep");
  auto answer = f.executor->Execute(episode);
  assert(answer.answer() == "Episode ep has 2 trace(s), no evaluated traces.");
  assert(answer.source_trace_ids_size() == 2);

  v1::StructuredQuery episodes;
  episodes.set_kind(v1::QUERY_KIND_LIST_EPISODES);
  auto listing = f.executor->Execute(episodes);
  assert(listing.answer().find("Found 1 episode(s).") == 0);
}

void TestUnsetKindIsRejected() {
  auto f     = MakeFixture();
  bool threw = false;
  try {
    f.executor->Execute(v1::StructuredQuery{});
  } catch (const util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestListTracesUsesDefaultLimit();
  TestGetTrace();
  TestStatsAndToolUsageHonourFilter();
  TestEpisodes();
  TestUnsetKindIsRejected();

  std::cout << "tracebrain_unit_query_executor: pass\n";
  return 0;
}
