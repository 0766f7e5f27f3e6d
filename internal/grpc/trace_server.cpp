#include "trace_server.hpp"

#include "grpc_error.hpp"

namespace tracebrain::grpc {

using namespace tracebrain::v1;

util::Deadline DeadlineFor(const ::grpc::ServerContext* context, std::chrono::milliseconds fallback) {
  if (context == nullptr) {
    return util::Deadline::After(fallback);
  }

  const auto client = context->deadline();
  const auto now    = std::chrono::system_clock::now();
  // No client deadline shows up as an infinitely distant time point.
  if (client == std::chrono::system_clock::time_point::max() || client > now + std::chrono::hours(24 * 365)) {
    return util::Deadline::After(fallback);
  }
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(client - now);
  return util::Deadline(std::chrono::steady_clock::now() + left);
}

TraceServer::TraceServer(std::shared_ptr<tracebrain::service::TraceService> svc, std::chrono::milliseconds default_deadline)
    : service_(std::move(svc)), default_deadline_(default_deadline) {
}

::grpc::Status TraceServer::IngestTrace(::grpc::ServerContext* context, const IngestTraceRequest* req, IngestTraceResponse* resp) {
  try {
    *resp = service_->Ingest(*req, DeadlineFor(context, default_deadline_));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TraceServer::ListTraces(::grpc::ServerContext* context, const ListTracesRequest* req, ListTracesResponse* resp) {
  try {
    *resp = service_->List(*req, DeadlineFor(context, default_deadline_));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TraceServer::GetTrace(::grpc::ServerContext* context, const GetTraceRequest* req, Trace* resp) {
  try {
    *resp = service_->Get(*req, DeadlineFor(context, default_deadline_));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TraceServer::AddFeedback(::grpc::ServerContext* context, const AddFeedbackRequest* req, Trace* resp) {
  try {
    *resp = service_->AddFeedback(*req, DeadlineFor(context, default_deadline_));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TraceServer::SignalTrace(::grpc::ServerContext* context, const SignalTraceRequest* req, SignalTraceResponse* resp) {
  try {
    *resp = service_->Signal(*req, DeadlineFor(context, default_deadline_));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TraceServer::EvaluateTrace(::grpc::ServerContext* context, const EvaluateTraceRequest* req, EvaluateTraceResponse* resp) {
  try {
    *resp = service_->Evaluate(*req, DeadlineFor(context, default_deadline_));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TraceServer::GetEpisodeTraces(::grpc::ServerContext* context, const GetEpisodeTracesRequest* req, GetEpisodeTracesResponse* resp) {
  try {
    *resp = service_->EpisodeTraces(*req, DeadlineFor(context, default_deadline_));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TraceServer::ListEpisodes(::grpc::ServerContext* context, const ListEpisodesRequest* req, ListEpisodesResponse* resp) {
  try {
    *resp = service_->ListEpisodes(*req, DeadlineFor(context, default_deadline_));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TraceServer::ListReviewQueue(::grpc::ServerContext* context, const ListReviewQueueRequest* req, ListReviewQueueResponse* resp) {
  try {
    *resp = service_->ReviewQueue(*req, DeadlineFor(context, default_deadline_));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TraceServer::GetStats(::grpc::ServerContext* context, const GetStatsRequest* req, TraceStats* resp) {
  try {
    *resp = service_->Stats(*req, DeadlineFor(context, default_deadline_));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TraceServer::GetToolUsage(::grpc::ServerContext* context, const GetToolUsageRequest* req, GetToolUsageResponse* resp) {
  try {
    *resp = service_->ToolUsage(*req, DeadlineFor(context, default_deadline_));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TraceServer::NaturalLanguageQuery(::grpc::ServerContext* context, const NaturalLanguageQueryRequest* req, QueryAnswer* resp) {
  try {
    *resp = service_->Query(*req, DeadlineFor(context, default_deadline_));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TraceServer::ReconstructSpan(::grpc::ServerContext* context, const ReconstructSpanRequest* req, ReconstructSpanResponse* resp) {
  try {
    *resp = service_->Reconstruct(*req, DeadlineFor(context, default_deadline_));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace tracebrain::grpc
