#include "trace_service.hpp"

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include "internal/analytics/analytics_engine.hpp"
#include "internal/core/trace_store.hpp"
#include "internal/evaluation/evaluation_scheduler.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/query/query_executor.hpp"
#include "internal/query/query_translator.hpp"
#include "internal/util/errors.hpp"

namespace tracebrain::service {

using namespace tracebrain::v1;

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string& trace_id, Fn&& fn) {
  tracebrain::observability::SpanScope span(route);
  if (!trace_id.empty()) {
    span.SetAttribute("trace.id", trace_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto result = fn();
    tracebrain::observability::Metrics::Instance().RecordRequest(route, true);
    tracebrain::observability::Metrics::Instance().ObserveRequestLatencyMs(route, ElapsedMs(started_at));
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    TRACEBRAIN_LOG_ERROR("RPC failed", {tracebrain::observability::StringField("route", route),
                                        tracebrain::observability::StringField("error", ex.what()),
                                        tracebrain::observability::StringField("trace_id", trace_id)});
    tracebrain::observability::Metrics::Instance().RecordRequest(route, false);
    tracebrain::observability::Metrics::Instance().ObserveRequestLatencyMs(route, ElapsedMs(started_at));
    throw;
  }
}

void RequireId(const std::string& value, const char* field) {
  if (value.empty()) {
    throw util::ValidationError(std::string(field) + " is required");
  }
}

} // namespace

TraceService::TraceService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

int TraceService::Limit(int32_t requested) const {
  if (requested < 0) {
    throw util::ValidationError("limit must not be negative");
  }
  if (requested == 0) {
    return static_cast<int>(ctx_.default_limit);
  }
  return std::min(requested, static_cast<int32_t>(ctx_.max_limit));
}

IngestTraceResponse TraceService::Ingest(const IngestTraceRequest& req, const util::Deadline& deadline) {
  return ObserveRpc("IngestTrace", req.trace_id(), [&] {
    RequireId(req.trace_id(), "trace_id");
    std::vector<Span> spans(req.spans().begin(), req.spans().end());
    auto result = ctx_.store->Ingest(req.trace_id(), spans, req.attributes(), req.has_feedback() ? &req.feedback() : nullptr, deadline);

    IngestTraceResponse resp;
    *resp.mutable_trace() = std::move(result.trace);
    resp.set_spans_added(result.spans_added);
    resp.set_spans_skipped(result.spans_skipped);
    return resp;
  });
}

ListTracesResponse TraceService::List(const ListTracesRequest& req, const util::Deadline& deadline) {
  return ObserveRpc("ListTraces", {}, [&] {
    auto page = ctx_.store->List(req.filter(), req.skip(), Limit(req.limit()), deadline);

    ListTracesResponse resp;
    for (auto& trace : page.traces) {
      *resp.add_traces() = std::move(trace);
    }
    resp.set_total(page.total);
    return resp;
  });
}

Trace TraceService::Get(const GetTraceRequest& req, const util::Deadline& deadline) {
  return ObserveRpc("GetTrace", req.trace_id(), [&] {
    RequireId(req.trace_id(), "trace_id");
    return ctx_.store->Get(req.trace_id(), deadline);
  });
}

Trace TraceService::AddFeedback(const AddFeedbackRequest& req, const util::Deadline& deadline) {
  return ObserveRpc("AddFeedback", req.trace_id(), [&] {
    RequireId(req.trace_id(), "trace_id");
    if (!req.has_feedback()) {
      throw util::ValidationError("feedback is required");
    }
    return ctx_.store->AddFeedback(req.trace_id(), req.feedback(), deadline);
  });
}

SignalTraceResponse TraceService::Signal(const SignalTraceRequest& req, const util::Deadline& deadline) {
  return ObserveRpc("SignalTrace", req.trace_id(), [&] {
    RequireId(req.trace_id(), "trace_id");
    SignalTraceResponse resp;
    *resp.mutable_signal() = ctx_.store->Signal(req.trace_id(), req.reason(), deadline);
    return resp;
  });
}

EvaluateTraceResponse TraceService::Evaluate(const EvaluateTraceRequest& req, const util::Deadline& deadline) {
  return ObserveRpc("EvaluateTrace", req.trace_id(), [&] {
    RequireId(req.trace_id(), "trace_id");
    if (!ctx_.evaluations) {
      throw util::ProviderError("evaluation is disabled");
    }
    // NotFound surfaces here instead of in the worker.
    ctx_.store->Get(req.trace_id(), deadline);

    if (!ctx_.evaluations->Enqueue({req.trace_id(), req.judge_model()})) {
      throw util::ProviderError("evaluation queue is shut down");
    }
    TRACEBRAIN_LOG_DEBUG("Evaluation queued", {tracebrain::observability::StringField("trace_id", req.trace_id())});

    EvaluateTraceResponse resp;
    resp.set_trace_id(req.trace_id());
    resp.set_queued(true);
    return resp;
  });
}

GetEpisodeTracesResponse TraceService::EpisodeTraces(const GetEpisodeTracesRequest& req, const util::Deadline& deadline) {
  return ObserveRpc("GetEpisodeTraces", {}, [&] {
    RequireId(req.episode_id(), "episode_id");
    auto traces = ctx_.store->EpisodeTraces(req.episode_id(), deadline);

    GetEpisodeTracesResponse resp;
    *resp.mutable_summary() = analytics::SummarizeEpisode(req.episode_id(), traces);
    for (auto& trace : traces) {
      *resp.add_traces() = std::move(trace);
    }
    return resp;
  });
}

ListEpisodesResponse TraceService::ListEpisodes(const ListEpisodesRequest& req, const util::Deadline& deadline) {
  return ObserveRpc("ListEpisodes", {}, [&] {
    std::optional<double> max_avg_confidence;
    if (req.has_max_avg_confidence()) {
      max_avg_confidence = req.max_avg_confidence();
    }
    auto page = ctx_.analytics->ListEpisodes(max_avg_confidence, req.skip(), Limit(req.limit()), deadline);

    ListEpisodesResponse resp;
    for (auto& episode : page.episodes) {
      *resp.add_episodes() = std::move(episode);
    }
    resp.set_total(page.total);
    return resp;
  });
}

ListReviewQueueResponse TraceService::ReviewQueue(const ListReviewQueueRequest& req, const util::Deadline& deadline) {
  return ObserveRpc("ListReviewQueue", {}, [&] {
    auto page = ctx_.store->ListReviewQueue(req.skip(), Limit(req.limit()), deadline);

    ListReviewQueueResponse resp;
    for (auto& signal : page.signals) {
      *resp.add_signals() = std::move(signal);
    }
    resp.set_total(page.total);
    return resp;
  });
}

TraceStats TraceService::Stats(const GetStatsRequest&, const util::Deadline& deadline) {
  return ObserveRpc("GetStats", {}, [&] { return ctx_.analytics->Stats(deadline); });
}

GetToolUsageResponse TraceService::ToolUsage(const GetToolUsageRequest&, const util::Deadline& deadline) {
  return ObserveRpc("GetToolUsage", {}, [&] {
    GetToolUsageResponse resp;
    for (auto& tool : ctx_.analytics->ToolUsageReport(deadline)) {
      *resp.add_tools() = std::move(tool);
    }
    return resp;
  });
}

QueryAnswer TraceService::Query(const NaturalLanguageQueryRequest& req, const util::Deadline& deadline) {
  return ObserveRpc("NaturalLanguageQuery", {}, [&] {
    if (req.question().empty()) {
      throw util::ValidationError("question is required");
    }
    auto query = ctx_.translator->Translate(req.question(), deadline);
    TRACEBRAIN_LOG_DEBUG("Question translated", {tracebrain::observability::IntField("kind", query.kind())});
    return ctx_.executor->Execute(query, deadline);
  });
}

ReconstructSpanResponse TraceService::Reconstruct(const ReconstructSpanRequest& req, const util::Deadline& deadline) {
  return ObserveRpc("ReconstructSpan", req.trace_id(), [&] {
    RequireId(req.trace_id(), "trace_id");
    RequireId(req.span_id(), "span_id");
    auto reconstruction = ctx_.store->Reconstruct(req.trace_id(), req.span_id(), deadline);

    ReconstructSpanResponse resp;
    resp.set_content(std::move(reconstruction.content));
    for (auto& id : reconstruction.path) {
      resp.add_path(std::move(id));
    }
    return resp;
  });
}

} // namespace tracebrain::service
