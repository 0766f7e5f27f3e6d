#pragma once

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <memory>

#include "internal/service/trace_service.hpp"
#include "internal/util/deadline.hpp"
#include "tracebrain/services/v1/trace_service.grpc.pb.h"
#include "tracebrain/v1.hpp"

namespace tracebrain::grpc {

// Client deadline when the call carries one, otherwise now + fallback.
util::Deadline DeadlineFor(const ::grpc::ServerContext* context, std::chrono::milliseconds fallback);

class TraceServer final : public tracebrain::v1::TraceService::Service {
 public:
  TraceServer(std::shared_ptr<tracebrain::service::TraceService> svc, std::chrono::milliseconds default_deadline);

  ::grpc::Status IngestTrace(::grpc::ServerContext*, const tracebrain::v1::IngestTraceRequest*, tracebrain::v1::IngestTraceResponse*) override;

  ::grpc::Status ListTraces(::grpc::ServerContext*, const tracebrain::v1::ListTracesRequest*, tracebrain::v1::ListTracesResponse*) override;

  ::grpc::Status GetTrace(::grpc::ServerContext*, const tracebrain::v1::GetTraceRequest*, tracebrain::v1::Trace*) override;

  ::grpc::Status AddFeedback(::grpc::ServerContext*, const tracebrain::v1::AddFeedbackRequest*, tracebrain::v1::Trace*) override;

  ::grpc::Status SignalTrace(::grpc::ServerContext*, const tracebrain::v1::SignalTraceRequest*, tracebrain::v1::SignalTraceResponse*) override;

  ::grpc::Status EvaluateTrace(::grpc::ServerContext*, const tracebrain::v1::EvaluateTraceRequest*,
                               tracebrain::v1::EvaluateTraceResponse*) override;

  ::grpc::Status GetEpisodeTraces(::grpc::ServerContext*, const tracebrain::v1::GetEpisodeTracesRequest*,
                                  tracebrain::v1::GetEpisodeTracesResponse*) override;

  ::grpc::Status ListEpisodes(::grpc::ServerContext*, const tracebrain::v1::ListEpisodesRequest*,
                              tracebrain::v1::ListEpisodesResponse*) override;

  ::grpc::Status ListReviewQueue(::grpc::ServerContext*, const tracebrain::v1::ListReviewQueueRequest*,
                                 tracebrain::v1::ListReviewQueueResponse*) override;

  ::grpc::Status GetStats(::grpc::ServerContext*, const tracebrain::v1::GetStatsRequest*, tracebrain::v1::TraceStats*) override;

  ::grpc::Status GetToolUsage(::grpc::ServerContext*, const tracebrain::v1::GetToolUsageRequest*,
                              tracebrain::v1::GetToolUsageResponse*) override;

  ::grpc::Status NaturalLanguageQuery(::grpc::ServerContext*, const tracebrain::v1::NaturalLanguageQueryRequest*,
                                      tracebrain::v1::QueryAnswer*) override;

  ::grpc::Status ReconstructSpan(::grpc::ServerContext*, const tracebrain::v1::ReconstructSpanRequest*,
                                 tracebrain::v1::ReconstructSpanResponse*) override;

 private:
  std::shared_ptr<tracebrain::service::TraceService> service_;
  std::chrono::milliseconds                          default_deadline_;
};

} // namespace tracebrain::grpc
