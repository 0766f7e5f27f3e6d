#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace tracebrain::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertTrace(Transaction&, const model::TraceRecord&) override;
  Result UpdateTrace(Transaction&, const model::TraceRecord&) override;
  std::optional<model::TraceRecord> GetTrace(Transaction&, const std::string&) override;
  std::vector<model::TraceRecord> ListTraces(Transaction&) override;

  Result InsertSpans(Transaction&, const std::vector<model::SpanRecord>&) override;
  std::vector<model::SpanRecord> GetSpans(Transaction&, const std::string&) override;
  std::vector<model::SpanRecord> ListSpans(Transaction&) override;

  Result AppendFeedback(Transaction&, const model::FeedbackRecord&) override;
  std::vector<model::FeedbackRecord> GetFeedback(Transaction&, const std::string&) override;
  std::vector<model::FeedbackRecord> ListFeedback(Transaction&) override;

  Result AppendReviewSignal(Transaction&, const model::ReviewSignalRecord&) override;
  std::vector<model::ReviewSignalRecord> GetReviewSignals(Transaction&, const std::string& trace_id) override;
  std::vector<model::ReviewSignalRecord> ListReviewSignals(Transaction&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::TraceRecord> traces;
    // insertion order of trace ids, so listings are deterministic
    std::vector<std::string> trace_order;

    std::unordered_map<std::string, std::vector<model::SpanRecord>> spans;
    std::unordered_map<std::string, std::vector<model::FeedbackRecord>> feedback;
    std::vector<model::ReviewSignalRecord> review_signals;
  };

  std::mutex mutex_;
  State committed_;
  // bumped on every commit that writes the trace
  std::unordered_map<std::string, uint64_t> trace_versions_;
};

}
