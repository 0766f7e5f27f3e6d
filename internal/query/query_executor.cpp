#include "query_executor.hpp"

#include <iomanip>
#include <optional>
#include <sstream>

#include "internal/analytics/analytics_engine.hpp"
#include "internal/core/trace_filter.hpp"
#include "internal/core/trace_store.hpp"
#include "internal/schema/attribute_keys.hpp"
#include "internal/util/errors.hpp"

namespace tracebrain::query {

using tracebrain::core::v1::Trace;
using tracebrain::query::v1::QueryAnswer;
using tracebrain::query::v1::StructuredQuery;

namespace {

// Cap on ids reported as sources for aggregate answers.
constexpr int kMaxSources = 20;

std::string StatusOf(const Trace& trace) {
  const auto& fields = trace.attributes().fields();
  auto        it     = fields.find(schema::keys::TRACE_STATUS);
  if (it == fields.end() || it->second.kind_case() != google::protobuf::Value::kStringValue) {
    return "unset";
  }
  return it->second.string_value();
}

std::vector<Trace> Filtered(std::vector<Trace> traces, const tracebrain::query::v1::TraceFilter& filter) {
  std::vector<Trace> out;
  for (auto& trace : traces) {
    if (core::Matches(filter, trace)) {
      out.push_back(std::move(trace));
    }
  }
  return out;
}

void AddSources(QueryAnswer* answer, const std::vector<Trace>& traces) {
  for (const auto& trace : traces) {
    if (answer->source_trace_ids_size() >= kMaxSources) {
      break;
    }
    answer->add_source_trace_ids(trace.trace_id());
  }
}

} // namespace

QueryExecutor::QueryExecutor(std::shared_ptr<core::TraceStore> store, std::shared_ptr<analytics::AnalyticsEngine> analytics, int default_limit)
    : store_(std::move(store)), analytics_(std::move(analytics)), default_limit_(default_limit) {
}

QueryAnswer QueryExecutor::Execute(const StructuredQuery& query, const util::Deadline& deadline) {
  QueryAnswer answer;
  *answer.mutable_query() = query;

  const int          limit = query.limit() > 0 ? query.limit() : default_limit_;
  std::ostringstream text;
  text << std::fixed << std::setprecision(2);

  switch (query.kind()) {
    case tracebrain::query::v1::QUERY_KIND_LIST_TRACES: {
      auto page = store_->List(query.filter(), 0, limit, deadline);
      text << "Found " << page.total << " matching trace(s)";
      if (page.total > static_cast<int64_t>(page.traces.size())) {
        text << ", showing " << page.traces.size();
      }
      text << ".";
      for (const auto& trace : page.traces) {
        text << "\n- " << trace.trace_id() << " (" << StatusOf(trace) << ", " << trace.spans_size() << " spans)";
        answer.add_source_trace_ids(trace.trace_id());
      }
      break;
    }
    case tracebrain::query::v1::QUERY_KIND_GET_TRACE: {
      auto trace = store_->Get(query.trace_id(), deadline);
      text << "Trace " << trace.trace_id() << " has " << trace.spans_size() << " spans and " << trace.feedbacks_size()
           << " feedback entries; status " << StatusOf(trace) << ".";
      if (auto evaluation = core::EvaluationOf(trace)) {
        text << " AI evaluation confidence " << evaluation->confidence << ".";
      }
      answer.add_source_trace_ids(trace.trace_id());
      break;
    }
    case tracebrain::query::v1::QUERY_KIND_TRACE_STATS: {
      auto traces = Filtered(store_->Snapshot(deadline), query.filter());
      auto stats  = analytics::ComputeStats(traces, util::Now());
      text << stats.trace_count() << " trace(s), " << stats.span_count() << " span(s), " << stats.feedback_count()
           << " feedback entries.";
      for (const auto& [status, count] : stats.status_breakdown()) {
        text << "\n- status " << status << ": " << count;
      }
      if (stats.has_avg_confidence()) {
        text << "\nAverage confidence over " << stats.evaluated_trace_count() << " evaluated trace(s): " << stats.avg_confidence();
      } else {
        text << "\nNo evaluated traces.";
      }
      AddSources(&answer, traces);
      break;
    }
    case tracebrain::query::v1::QUERY_KIND_TOOL_USAGE: {
      auto traces = Filtered(store_->Snapshot(deadline), query.filter());
      auto usage  = analytics::ComputeToolUsage(traces);
      if (usage.empty()) {
        text << "No tool invocations recorded.";
      }
      for (const auto& tool : usage) {
        text << "- " << tool.tool_name() << ": " << tool.invocation_count() << " call(s), avg " << tool.avg_duration_ms() << " ms, "
             << tool.error_count() << " error(s)\n";
      }
      AddSources(&answer, traces);
      break;
    }
    case tracebrain::query::v1::QUERY_KIND_EPISODE_TRACES: {
      auto traces  = store_->EpisodeTraces(query.episode_id(), deadline);
      auto summary = analytics::SummarizeEpisode(query.episode_id(), traces);
      text << "Episode " << summary.episode_id() << " has " << summary.trace_count() << " trace(s)";
      if (summary.has_avg_confidence()) {
        text << ", average confidence " << summary.avg_confidence();
      } else {
        text << ", no evaluated traces";
      }
      text << ".";
      AddSources(&answer, traces);
      break;
    }
    case tracebrain::query::v1::QUERY_KIND_LIST_EPISODES: {
      std::optional<double> max_confidence;
      if (query.filter().has_max_confidence()) {
        max_confidence = query.filter().max_confidence();
      }
      auto page = analytics_->ListEpisodes(max_confidence, 0, limit, deadline);
      text << "Found " << page.total << " episode(s).";
      for (const auto& episode : page.episodes) {
        text << "\n- " << episode.episode_id() << " (" << episode.trace_count() << " traces";
        if (episode.has_avg_confidence()) {
          text << ", confidence " << episode.avg_confidence();
        }
        text << ")";
      }
      break;
    }
    default:
      throw util::ValidationError("query kind is not set");
  }

  auto rendered = text.str();
  while (!rendered.empty() && rendered.back() == '\n') {
    rendered.pop_back();
  }
  answer.set_answer(rendered);
  return answer;
}

} // namespace tracebrain::query
