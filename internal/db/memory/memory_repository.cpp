#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace tracebrain::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Traces
// ------------------------------------------------------------------

Result MemoryRepository::InsertTrace(Transaction& t, const model::TraceRecord& r) {
  if (TX(t).View().traces.contains(r.trace_id)) return Result::Err(ErrorCode::AlreadyExists, "trace exists: " + r.trace_id);
  auto& s = TX(t).Mutable(r.trace_id);
  s.traces[r.trace_id] = r;
  s.trace_order.push_back(r.trace_id);
  return Result::Ok();
}

Result MemoryRepository::UpdateTrace(Transaction& t, const model::TraceRecord& r) {
  if (!TX(t).View().traces.contains(r.trace_id)) return Result::Err(ErrorCode::NotFound, "trace not found: " + r.trace_id);
  auto& stored           = TX(t).Mutable(r.trace_id).traces[r.trace_id];
  stored.attributes_json = r.attributes_json;
  stored.updated_at_ms   = r.updated_at_ms;
  return Result::Ok();
}

std::optional<model::TraceRecord> MemoryRepository::GetTrace(Transaction& t, const std::string& trace_id) {
  const auto& s  = TX(t).View();
  auto        it = s.traces.find(trace_id);
  if (it == s.traces.end()) return std::nullopt;
  return it->second;
}

std::vector<model::TraceRecord> MemoryRepository::ListTraces(Transaction& t) {
  const auto&                     s = TX(t).View();
  std::vector<model::TraceRecord> out;
  out.reserve(s.trace_order.size());
  for (const auto& id : s.trace_order) {
    out.push_back(s.traces.at(id));
  }
  return out;
}

// ------------------------------------------------------------------
// Spans
// ------------------------------------------------------------------

Result MemoryRepository::InsertSpans(Transaction& t, const std::vector<model::SpanRecord>& records) {
  const auto& view = TX(t).View();
  for (const auto& r : records) {
    if (!view.traces.contains(r.trace_id)) {
      return Result::Err(ErrorCode::ConstraintViolation, "span references unknown trace: " + r.trace_id);
    }
    auto existing = view.spans.find(r.trace_id);
    if (existing == view.spans.end()) continue;
    for (const auto& stored : existing->second) {
      if (stored.span_id == r.span_id) return Result::Err(ErrorCode::AlreadyExists, "span exists: " + r.span_id);
    }
  }

  for (const auto& r : records) {
    TX(t).Mutable(r.trace_id).spans[r.trace_id].push_back(r);
  }
  return Result::Ok();
}

std::vector<model::SpanRecord> MemoryRepository::GetSpans(Transaction& t, const std::string& trace_id) {
  const auto& s  = TX(t).View();
  auto        it = s.spans.find(trace_id);
  if (it == s.spans.end()) return {};
  return it->second;
}

std::vector<model::SpanRecord> MemoryRepository::ListSpans(Transaction& t) {
  const auto&                    s = TX(t).View();
  std::vector<model::SpanRecord> out;
  for (const auto& id : s.trace_order) {
    auto it = s.spans.find(id);
    if (it == s.spans.end()) continue;
    out.insert(out.end(), it->second.begin(), it->second.end());
  }
  return out;
}

// ------------------------------------------------------------------
// Feedback
// ------------------------------------------------------------------

Result MemoryRepository::AppendFeedback(Transaction& t, const model::FeedbackRecord& r) {
  if (!TX(t).View().traces.contains(r.trace_id)) return Result::Err(ErrorCode::NotFound, "trace not found: " + r.trace_id);
  TX(t).Mutable(r.trace_id).feedback[r.trace_id].push_back(r);
  return Result::Ok();
}

std::vector<model::FeedbackRecord> MemoryRepository::GetFeedback(Transaction& t, const std::string& trace_id) {
  const auto& s  = TX(t).View();
  auto        it = s.feedback.find(trace_id);
  if (it == s.feedback.end()) return {};
  return it->second;
}

std::vector<model::FeedbackRecord> MemoryRepository::ListFeedback(Transaction& t) {
  const auto&                        s = TX(t).View();
  std::vector<model::FeedbackRecord> out;
  for (const auto& id : s.trace_order) {
    auto it = s.feedback.find(id);
    if (it == s.feedback.end()) continue;
    out.insert(out.end(), it->second.begin(), it->second.end());
  }
  return out;
}

// ------------------------------------------------------------------
// Review queue
// ------------------------------------------------------------------

Result MemoryRepository::AppendReviewSignal(Transaction& t, const model::ReviewSignalRecord& r) {
  if (!TX(t).View().traces.contains(r.trace_id)) return Result::Err(ErrorCode::NotFound, "trace not found: " + r.trace_id);
  TX(t).AppendSignal(r);
  return Result::Ok();
}

std::vector<model::ReviewSignalRecord> MemoryRepository::GetReviewSignals(Transaction& t, const std::string& trace_id) {
  std::vector<model::ReviewSignalRecord> out;
  for (const auto& signal : TX(t).View().review_signals) {
    if (signal.trace_id == trace_id) out.push_back(signal);
  }
  return out;
}

std::vector<model::ReviewSignalRecord> MemoryRepository::ListReviewSignals(Transaction& t) {
  return TX(t).View().review_signals;
}

} // namespace tracebrain::db::memory
