#include "analytics_engine.hpp"

#include <algorithm>
#include <map>
#include <unordered_map>
#include <unordered_set>

#include "internal/core/trace_store.hpp"
#include "internal/schema/attribute_schema.hpp"
#include "internal/util/errors.hpp"

namespace tracebrain::analytics {

using tracebrain::analytics::v1::ToolUsage;
using tracebrain::analytics::v1::TraceStats;
using tracebrain::core::v1::EpisodeSummary;
using tracebrain::core::v1::Trace;

namespace {

constexpr const char* kUnset       = "unset";
constexpr const char* kUnknownTool = "unknown";

schema::TraceAttributes TraceAttributesOf(const Trace& trace) {
  return schema::ParseTraceAttributes(trace.attributes());
}

int64_t Nanos(const google::protobuf::Timestamp& ts) {
  return util::ToUnixNanos(ts);
}

} // namespace

TraceStats ComputeStats(const std::vector<Trace>& traces, util::TimePoint now) {
  TraceStats stats;

  const auto day_ago = util::ToProto(now - std::chrono::hours(24));

  double                          confidence_sum = 0.0;
  std::unordered_set<std::string> episodes;

  for (const auto& trace : traces) {
    stats.set_trace_count(stats.trace_count() + 1);
    stats.set_span_count(stats.span_count() + trace.spans_size());
    stats.set_feedback_count(stats.feedback_count() + trace.feedbacks_size());
    if (trace.feedbacks_size() > 0) {
      stats.set_traces_with_feedback(stats.traces_with_feedback() + 1);
    }
    if (Nanos(trace.created_at()) >= Nanos(day_ago)) {
      stats.set_traces_last_24h(stats.traces_last_24h() + 1);
    }

    auto attributes = TraceAttributesOf(trace);

    const std::string status = attributes.status ? std::string(schema::ToString(*attributes.status)) : kUnset;
    (*stats.mutable_status_breakdown())[status]++;

    if (attributes.error_type) {
      (*stats.mutable_error_type_breakdown())[std::string(schema::ToString(*attributes.error_type))]++;
    }

    if (attributes.evaluation) {
      stats.set_evaluated_trace_count(stats.evaluated_trace_count() + 1);
      confidence_sum += attributes.evaluation->confidence;
    }

    if (!attributes.episode_id.empty()) {
      episodes.insert(attributes.episode_id);
    }
  }

  if (stats.trace_count() > 0) {
    stats.set_avg_spans_per_trace(static_cast<double>(stats.span_count()) / static_cast<double>(stats.trace_count()));
  }
  if (stats.evaluated_trace_count() > 0) {
    stats.set_avg_confidence(confidence_sum / static_cast<double>(stats.evaluated_trace_count()));
  }
  stats.set_episode_count(static_cast<int64_t>(episodes.size()));
  return stats;
}

std::vector<ToolUsage> ComputeToolUsage(const std::vector<Trace>& traces) {
  struct Accumulator {
    int64_t invocations = 0;
    int64_t timed       = 0;
    double  total_ms    = 0.0;
    int64_t errors      = 0;
  };
  std::map<std::string, Accumulator> by_tool;

  for (const auto& trace : traces) {
    for (const auto& span : trace.spans()) {
      auto        attributes = schema::ParseSpanAttributes(span.attributes(), span.span_id());
      const auto* tool       = attributes.tool();
      if (!tool) {
        continue;
      }

      auto& acc = by_tool[tool->tool_name.empty() ? kUnknownTool : tool->tool_name];
      acc.invocations++;
      if (span.has_start_time() && span.has_end_time()) {
        const auto elapsed = Nanos(span.end_time()) - Nanos(span.start_time());
        acc.timed++;
        acc.total_ms += static_cast<double>(elapsed) / 1e6;
      }
      if (attributes.status.IsError()) {
        acc.errors++;
      }
    }
  }

  std::vector<ToolUsage> out;
  out.reserve(by_tool.size());
  for (const auto& [name, acc] : by_tool) {
    ToolUsage usage;
    usage.set_tool_name(name);
    usage.set_invocation_count(acc.invocations);
    usage.set_avg_duration_ms(acc.timed > 0 ? acc.total_ms / static_cast<double>(acc.timed) : 0.0);
    usage.set_error_count(acc.errors);
    out.push_back(std::move(usage));
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const ToolUsage& a, const ToolUsage& b) { return a.invocation_count() > b.invocation_count(); });
  return out;
}

EpisodeSummary SummarizeEpisode(const std::string& episode_id, const std::vector<Trace>& traces) {
  EpisodeSummary summary;
  summary.set_episode_id(episode_id);
  summary.set_trace_count(static_cast<int64_t>(traces.size()));

  double                          confidence_sum = 0.0;
  std::optional<int64_t>          first_start;
  std::optional<int64_t>          last_activity;
  std::optional<schema::Priority> priority;

  auto widen = [](std::optional<int64_t>& slot, int64_t value, bool keep_min) {
    if (!slot || (keep_min ? value < *slot : value > *slot)) {
      slot = value;
    }
  };

  for (const auto& trace : traces) {
    auto attributes = TraceAttributesOf(trace);
    if (attributes.evaluation) {
      summary.set_evaluated_trace_count(summary.evaluated_trace_count() + 1);
      confidence_sum += attributes.evaluation->confidence;
    }
    if (attributes.status) {
      summary.set_latest_status(std::string(schema::ToString(*attributes.status)));
    }
    if (attributes.priority && (!priority || *attributes.priority > *priority)) {
      priority = attributes.priority;
    }

    widen(last_activity, Nanos(trace.created_at()), false);
    for (const auto& span : trace.spans()) {
      if (span.has_start_time()) {
        widen(first_start, Nanos(span.start_time()), true);
      }
      if (span.has_end_time()) {
        widen(last_activity, Nanos(span.end_time()), false);
      }
      auto span_attributes = schema::ParseSpanAttributes(span.attributes(), span.span_id());
      if (span_attributes.usage) {
        summary.set_total_tokens(summary.total_tokens() + span_attributes.usage->total_tokens);
      }
    }
    if (!first_start) {
      widen(first_start, Nanos(trace.created_at()), true);
    }
  }

  if (summary.evaluated_trace_count() > 0) {
    summary.set_avg_confidence(confidence_sum / static_cast<double>(summary.evaluated_trace_count()));
  }
  if (first_start) {
    *summary.mutable_first_start_time() = util::FromUnixNanos(*first_start);
  }
  if (last_activity) {
    *summary.mutable_last_activity() = util::FromUnixNanos(*last_activity);
  }
  if (priority) {
    summary.set_priority(std::string(schema::ToString(*priority)));
  }
  return summary;
}

AnalyticsEngine::AnalyticsEngine(std::shared_ptr<core::TraceStore> store) : store_(std::move(store)) {
}

TraceStats AnalyticsEngine::Stats(const util::Deadline& deadline) {
  return ComputeStats(store_->Snapshot(deadline), util::Now());
}

std::vector<ToolUsage> AnalyticsEngine::ToolUsageReport(const util::Deadline& deadline) {
  return ComputeToolUsage(store_->Snapshot(deadline));
}

EpisodePage AnalyticsEngine::ListEpisodes(std::optional<double> max_avg_confidence, int skip, int limit, const util::Deadline& deadline) {
  if (skip < 0 || limit < 0) {
    throw util::ValidationError("skip and limit must not be negative");
  }
  if (max_avg_confidence && (*max_avg_confidence < 0.0 || *max_avg_confidence > 1.0)) {
    throw util::ValidationError("max_avg_confidence must be within [0, 1]");
  }

  std::vector<std::string>                            order;
  std::unordered_map<std::string, std::vector<Trace>> grouped;
  for (auto& trace : store_->Snapshot(deadline)) {
    auto episode_id = TraceAttributesOf(trace).episode_id;
    if (episode_id.empty()) {
      continue;
    }
    auto& bucket = grouped[episode_id];
    if (bucket.empty()) {
      order.push_back(episode_id);
    }
    bucket.push_back(std::move(trace));
  }

  std::vector<EpisodeSummary> summaries;
  for (const auto& episode_id : order) {
    auto summary = SummarizeEpisode(episode_id, grouped[episode_id]);
    if (max_avg_confidence && (!summary.has_avg_confidence() || summary.avg_confidence() > *max_avg_confidence)) {
      continue;
    }
    summaries.push_back(std::move(summary));
  }
  std::stable_sort(summaries.begin(), summaries.end(), [](const EpisodeSummary& a, const EpisodeSummary& b) {
    return Nanos(a.last_activity()) > Nanos(b.last_activity());
  });

  EpisodePage page;
  page.total = static_cast<int64_t>(summaries.size());
  for (std::size_t i = skip; i < summaries.size() && page.episodes.size() < static_cast<std::size_t>(limit); ++i) {
    page.episodes.push_back(std::move(summaries[i]));
  }
  return page;
}

} // namespace tracebrain::analytics
