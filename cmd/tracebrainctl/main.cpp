#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "tracebrain/services/v1/trace_service.grpc.pb.h"
#include "tracebrain/v1.hpp"

using namespace tracebrain::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  tracebrainctl <addr> ingest <request.json>\n"
            << "  tracebrainctl <addr> get <trace_id>\n"
            << "  tracebrainctl <addr> list [limit] [skip]\n"
            << "  tracebrainctl <addr> feedback <trace_id> <rating 1-5> [comment]\n"
            << "  tracebrainctl <addr> signal <trace_id> <reason>\n"
            << "  tracebrainctl <addr> evaluate <trace_id> [judge_model]\n"
            << "  tracebrainctl <addr> episode <episode_id>\n"
            << "  tracebrainctl <addr> episodes [max_avg_confidence]\n"
            << "  tracebrainctl <addr> review [limit]\n"
            << "  tracebrainctl <addr> stats\n"
            << "  tracebrainctl <addr> tools\n"
            << "  tracebrainctl <addr> ask <question...>\n"
            << "  tracebrainctl <addr> reconstruct <trace_id> <span_id>\n";
}

static void Print(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names    = true;
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    std::cerr << "failed to render response: " << status.message() << "\n";
    return;
  }
  std::cout << json;
}

static int Report(const grpc::Status& status, const google::protobuf::Message& resp) {
  if (!status.ok()) {
    std::cerr << "error (" << status.error_code() << "): " << status.error_message() << "\n";
    return 2;
  }
  Print(resp);
  return 0;
}

static bool ReadRequestFile(const std::string& path, IngestTraceRequest* req) {
  std::ifstream in(path);
  if (!in) {
    std::cerr << "cannot open " << path << "\n";
    return false;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  auto status = google::protobuf::util::JsonStringToMessage(buffer.str(), req);
  if (!status.ok()) {
    std::cerr << "invalid request file: " << status.message() << "\n";
    return false;
  }
  return true;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = TraceService::NewStub(channel);

  grpc::ClientContext ctx;
  // Natural language queries and ingestion of large traces can be slow.
  ctx.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(120));

  // ------------------------------------------------------------

  if (cmd == "ingest") {
    if (argc < 4) return 1;

    IngestTraceRequest req;
    if (!ReadRequestFile(argv[3], &req)) return 1;

    IngestTraceResponse resp;
    return Report(stub->IngestTrace(&ctx, req, &resp), resp);
  }

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetTraceRequest req;
    req.set_trace_id(argv[3]);
    Trace resp;
    return Report(stub->GetTrace(&ctx, req, &resp), resp);
  }

  if (cmd == "list") {
    ListTracesRequest req;
    if (argc >= 4) req.set_limit(std::stoi(argv[3]));
    if (argc >= 5) req.set_skip(std::stoi(argv[4]));

    ListTracesResponse resp;
    return Report(stub->ListTraces(&ctx, req, &resp), resp);
  }

  if (cmd == "feedback") {
    if (argc < 5) return 1;

    AddFeedbackRequest req;
    req.set_trace_id(argv[3]);
    req.mutable_feedback()->set_rating(std::stoi(argv[4]));
    if (argc >= 6) req.mutable_feedback()->set_comment(argv[5]);

    Trace resp;
    return Report(stub->AddFeedback(&ctx, req, &resp), resp);
  }

  if (cmd == "signal") {
    if (argc < 5) return 1;

    SignalTraceRequest req;
    req.set_trace_id(argv[3]);
    req.set_reason(argv[4]);

    SignalTraceResponse resp;
    return Report(stub->SignalTrace(&ctx, req, &resp), resp);
  }

  if (cmd == "evaluate") {
    if (argc < 4) return 1;

    EvaluateTraceRequest req;
    req.set_trace_id(argv[3]);
    if (argc >= 5) req.set_judge_model(argv[4]);

    EvaluateTraceResponse resp;
    return Report(stub->EvaluateTrace(&ctx, req, &resp), resp);
  }

  if (cmd == "episode") {
    if (argc < 4) return 1;

    GetEpisodeTracesRequest req;
    req.set_episode_id(argv[3]);

    GetEpisodeTracesResponse resp;
    return Report(stub->GetEpisodeTraces(&ctx, req, &resp), resp);
  }

  if (cmd == "episodes") {
    ListEpisodesRequest req;
    if (argc >= 4) req.set_max_avg_confidence(std::stod(argv[3]));

    ListEpisodesResponse resp;
    return Report(stub->ListEpisodes(&ctx, req, &resp), resp);
  }

  if (cmd == "review") {
    ListReviewQueueRequest req;
    if (argc >= 4) req.set_limit(std::stoi(argv[3]));

    ListReviewQueueResponse resp;
    return Report(stub->ListReviewQueue(&ctx, req, &resp), resp);
  }

  if (cmd == "stats") {
    GetStatsRequest req;
    TraceStats      resp;
    return Report(stub->GetStats(&ctx, req, &resp), resp);
  }

  if (cmd == "tools") {
    GetToolUsageRequest  req;
    GetToolUsageResponse resp;
    return Report(stub->GetToolUsage(&ctx, req, &resp), resp);
  }

  if (cmd == "ask") {
    if (argc < 4) return 1;

    std::string question = argv[3];
    for (int i = 4; i < argc; ++i) {
      question += " ";
      question += argv[i];
    }

    NaturalLanguageQueryRequest req;
    req.set_question(question);

    QueryAnswer resp;
    return Report(stub->NaturalLanguageQuery(&ctx, req, &resp), resp);
  }

  if (cmd == "reconstruct") {
    if (argc < 5) return 1;

    ReconstructSpanRequest req;
    req.set_trace_id(argv[3]);
    req.set_span_id(argv[4]);

    ReconstructSpanResponse resp;
    return Report(stub->ReconstructSpan(&ctx, req, &resp), resp);
  }

  Usage();
  return 1;
}
