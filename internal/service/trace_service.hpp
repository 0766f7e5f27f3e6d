#pragma once

#include "internal/util/deadline.hpp"
#include "service_context.hpp"
#include "tracebrain/v1.hpp"

namespace tracebrain::service {

/*
  Transport-independent facade over the store, analytics, query and
  evaluation components. One method per TraceService RPC; errors are the
  typed exceptions from internal/util/errors.hpp.
*/
class TraceService {
 public:
  explicit TraceService(ServiceContext ctx);

  tracebrain::v1::IngestTraceResponse Ingest(const tracebrain::v1::IngestTraceRequest& req, const util::Deadline& deadline = {});

  tracebrain::v1::ListTracesResponse List(const tracebrain::v1::ListTracesRequest& req, const util::Deadline& deadline = {});

  tracebrain::v1::Trace Get(const tracebrain::v1::GetTraceRequest& req, const util::Deadline& deadline = {});

  tracebrain::v1::Trace AddFeedback(const tracebrain::v1::AddFeedbackRequest& req, const util::Deadline& deadline = {});

  tracebrain::v1::SignalTraceResponse Signal(const tracebrain::v1::SignalTraceRequest& req, const util::Deadline& deadline = {});

  // Queues the trace for the judge model; the verdict is written later by
  // the evaluation worker.
  tracebrain::v1::EvaluateTraceResponse Evaluate(const tracebrain::v1::EvaluateTraceRequest& req, const util::Deadline& deadline = {});

  tracebrain::v1::GetEpisodeTracesResponse EpisodeTraces(const tracebrain::v1::GetEpisodeTracesRequest& req,
                                                         const util::Deadline&                         deadline = {});

  tracebrain::v1::ListEpisodesResponse ListEpisodes(const tracebrain::v1::ListEpisodesRequest& req, const util::Deadline& deadline = {});

  tracebrain::v1::ListReviewQueueResponse ReviewQueue(const tracebrain::v1::ListReviewQueueRequest& req,
                                                      const util::Deadline&                        deadline = {});

  tracebrain::v1::TraceStats Stats(const tracebrain::v1::GetStatsRequest& req, const util::Deadline& deadline = {});

  tracebrain::v1::GetToolUsageResponse ToolUsage(const tracebrain::v1::GetToolUsageRequest& req, const util::Deadline& deadline = {});

  tracebrain::v1::QueryAnswer Query(const tracebrain::v1::NaturalLanguageQueryRequest& req, const util::Deadline& deadline = {});

  tracebrain::v1::ReconstructSpanResponse Reconstruct(const tracebrain::v1::ReconstructSpanRequest& req,
                                                      const util::Deadline&                        deadline = {});

 private:
  int Limit(int32_t requested) const;

  ServiceContext ctx_;
};

} // namespace tracebrain::service
