#include "trace_store.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <algorithm>
#include <functional>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <unordered_set>

#include "internal/core/trace_filter.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/reconstruction/span_forest.hpp"
#include "internal/schema/attribute_keys.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace tracebrain::core {

using tracebrain::core::v1::Feedback;
using tracebrain::core::v1::ReviewSignal;
using tracebrain::core::v1::Span;
using tracebrain::core::v1::Trace;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = context + ": " + (result.message.empty() ? std::string(db::ToString(result.code)) : result.message);
  if (result.Retryable()) {
    throw util::TransactionConflict(message);
  }
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::AlreadyExists:
      throw util::ConflictError(message);
    default:
      throw std::runtime_error(message);
  }
}

Span ToSpan(const db::model::SpanRecord& record) {
  Span span;
  span.set_span_id(record.span_id);
  span.set_parent_id(record.parent_id);
  span.set_name(record.name);
  if (record.start_time_ns != 0) {
    *span.mutable_start_time() = util::FromUnixNanos(record.start_time_ns);
  }
  if (record.end_time_ns != 0) {
    *span.mutable_end_time() = util::FromUnixNanos(record.end_time_ns);
  }
  *span.mutable_attributes() = util::JsonToStruct(record.attributes_json);
  return span;
}

db::model::SpanRecord ToRecord(const std::string& trace_id, const Span& span, uint64_t seq) {
  db::model::SpanRecord record;
  record.trace_id        = trace_id;
  record.span_id         = span.span_id();
  record.parent_id       = span.parent_id();
  record.name            = span.name();
  record.start_time_ns   = util::ToUnixNanos(span.start_time());
  record.end_time_ns     = util::ToUnixNanos(span.end_time());
  record.attributes_json = util::StructToJson(span.attributes());
  record.seq             = seq;
  return record;
}

Feedback ToFeedback(const db::model::FeedbackRecord& record) {
  Feedback feedback;
  util::JsonToMessage(record.json, &feedback, true);
  return feedback;
}

ReviewSignal ToSignal(const db::model::ReviewSignalRecord& record) {
  ReviewSignal signal;
  signal.set_trace_id(record.trace_id);
  signal.set_reason(record.reason);
  *signal.mutable_created_at() = util::ToProto(util::FromUnixMillis(record.created_at_ms));
  return signal;
}

bool SameSpan(const Span& a, const Span& b) {
  return a.span_id() == b.span_id() && a.parent_id() == b.parent_id() && a.name() == b.name() &&
         util::ToUnixNanos(a.start_time()) == util::ToUnixNanos(b.start_time()) &&
         util::ToUnixNanos(a.end_time()) == util::ToUnixNanos(b.end_time()) &&
         google::protobuf::util::MessageDifferencer::Equals(a.attributes(), b.attributes());
}

void ValidateSpan(const Span& span) {
  if (span.span_id().empty()) {
    throw util::ValidationError("span_id is required");
  }
  if (span.parent_id() == span.span_id()) {
    throw util::CycleDetected(span.span_id());
  }
  if (span.has_start_time() && span.has_end_time() && util::ToUnixNanos(span.start_time()) > util::ToUnixNanos(span.end_time())) {
    throw util::ValidationError("start_time is after end_time", span.span_id());
  }
  schema::ParseSpanAttributes(span.attributes(), span.span_id());
}

void ValidateFeedback(const Feedback& feedback) {
  if (feedback.rating() < 0 || feedback.rating() > 5) {
    throw util::ValidationError("feedback rating must be within [1, 5] or unset");
  }
}

void FillContent(Trace* trace) {
  std::vector<Span> spans(trace->spans().begin(), trace->spans().end());
  auto              forest = reconstruction::SpanForest::Build(std::move(spans));
  for (auto& span : *trace->mutable_spans()) {
    span.set_content(forest.Reconstruct(span.span_id()));
  }
}

void CheckPage(int skip, int limit) {
  if (skip < 0) {
    throw util::ValidationError("skip must not be negative");
  }
  if (limit < 0) {
    throw util::ValidationError("limit must not be negative");
  }
}

template <typename T>
std::vector<T> Window(std::vector<T> items, int skip, int limit) {
  if (static_cast<std::size_t>(skip) >= items.size()) {
    return {};
  }
  auto first = items.begin() + skip;
  auto last  = items.size() - skip > static_cast<std::size_t>(limit) ? first + limit : items.end();
  return std::vector<T>(std::make_move_iterator(first), std::make_move_iterator(last));
}

} // namespace

TraceStore::TraceStore(std::shared_ptr<db::Repository> repository, TraceStoreOptions options)
    : repository_(std::move(repository)), options_(options) {
  if (!repository_) {
    throw std::invalid_argument("TraceStore requires a repository");
  }
}

std::mutex& TraceStore::TraceLock(const std::string& trace_id) {
  return trace_locks_[std::hash<std::string>{}(trace_id) % kTraceLockStripes];
}

// Runs fn in a fresh transaction and commits it. Lost commits are retried
// with linear backoff until max_commit_retries or the deadline runs out.
template <typename Fn>
auto TraceStore::Mutate(const std::string& operation, const util::Deadline& deadline, Fn&& fn) {
  for (uint32_t attempt = 0;; ++attempt) {
    deadline.ThrowIfExpired(operation);
    try {
      auto tx     = repository_->Begin();
      auto result = fn(*tx);
      deadline.ThrowIfExpired(operation);
      tx->Commit();
      return result;
    } catch (const util::TransactionConflict& e) {
      if (attempt >= options_.max_commit_retries) {
        throw;
      }
      TRACEBRAIN_LOG_DEBUG("retrying transaction", {observability::StringField("operation", operation),
                                                     observability::IntField("attempt", attempt + 1),
                                                     observability::StringField("reason", e.what())});
    }

    auto pause = options_.commit_retry_backoff * (attempt + 1);
    if (auto remaining = deadline.Remaining()) {
      pause = std::min(pause, *remaining);
    }
    std::this_thread::sleep_for(pause);
  }
}

Trace TraceStore::LoadTrace(db::Transaction& tx, const std::string& trace_id, bool with_content) {
  auto record = repository_->GetTrace(tx, trace_id);
  if (!record) {
    throw util::NotFound("trace not found: " + trace_id);
  }

  Trace trace;
  trace.set_trace_id(record->trace_id);
  *trace.mutable_created_at() = util::ToProto(util::FromUnixMillis(record->created_at_ms));
  *trace.mutable_attributes() = util::JsonToStruct(record->attributes_json);

  for (const auto& span : repository_->GetSpans(tx, trace_id)) {
    *trace.add_spans() = ToSpan(span);
  }
  for (const auto& feedback : repository_->GetFeedback(tx, trace_id)) {
    *trace.add_feedbacks() = ToFeedback(feedback);
  }
  for (const auto& signal : repository_->GetReviewSignals(tx, trace_id)) {
    *trace.add_signals() = ToSignal(signal);
  }

  if (with_content) {
    FillContent(&trace);
  }
  return trace;
}

std::vector<Trace> TraceStore::LoadAll(db::Transaction& tx, bool with_content) {
  std::vector<Trace>                           traces;
  std::unordered_map<std::string, std::size_t> index;

  for (const auto& record : repository_->ListTraces(tx)) {
    Trace trace;
    trace.set_trace_id(record.trace_id);
    *trace.mutable_created_at() = util::ToProto(util::FromUnixMillis(record.created_at_ms));
    *trace.mutable_attributes() = util::JsonToStruct(record.attributes_json);
    index.emplace(record.trace_id, traces.size());
    traces.push_back(std::move(trace));
  }

  for (const auto& span : repository_->ListSpans(tx)) {
    if (auto it = index.find(span.trace_id); it != index.end()) {
      *traces[it->second].add_spans() = ToSpan(span);
    }
  }
  for (const auto& feedback : repository_->ListFeedback(tx)) {
    if (auto it = index.find(feedback.trace_id); it != index.end()) {
      *traces[it->second].add_feedbacks() = ToFeedback(feedback);
    }
  }
  for (const auto& signal : repository_->ListReviewSignals(tx)) {
    if (auto it = index.find(signal.trace_id); it != index.end()) {
      *traces[it->second].add_signals() = ToSignal(signal);
    }
  }

  if (with_content) {
    for (auto& trace : traces) {
      FillContent(&trace);
    }
  }
  return traces;
}

// ------------------------------------------------------------------
// Ingestion
// ------------------------------------------------------------------

IngestResult TraceStore::Ingest(const std::string& trace_id, const std::vector<Span>& spans, const google::protobuf::Struct& attributes,
                                const Feedback* feedback, const util::Deadline& deadline) {
  observability::SpanScope scope("TraceStore.Ingest");
  scope.SetAttribute("trace_id", trace_id);

  if (trace_id.empty()) {
    throw util::ValidationError("trace_id is required");
  }

  // attribute schema first; nothing below runs for a malformed batch
  std::vector<Span> incoming;
  incoming.reserve(spans.size());
  for (const auto& span : spans) {
    ValidateSpan(span);
    Span copy = span;
    copy.clear_content();
    incoming.push_back(std::move(copy));
  }
  if (feedback) {
    ValidateFeedback(*feedback);
  }

  std::lock_guard<std::mutex> lock(TraceLock(trace_id));

  auto result = Mutate("ingest", deadline, [&](db::Transaction& tx) {
    IngestResult out;
    const auto   now_ms = util::ToUnixMillis(util::Now());

    auto                     existing = repository_->GetTrace(tx, trace_id);
    std::vector<Span>        stored;
    google::protobuf::Struct merged;
    if (existing) {
      for (const auto& record : repository_->GetSpans(tx, trace_id)) {
        stored.push_back(ToSpan(record));
      }
      merged = util::JsonToStruct(existing->attributes_json);
    }
    for (const auto& [key, value] : attributes.fields()) {
      (*merged.mutable_fields())[key] = value;
    }
    schema::ParseTraceAttributes(merged);

    std::unordered_map<std::string, const Span*> known;
    for (const auto& span : stored) {
      known.emplace(span.span_id(), &span);
    }

    std::vector<Span> added;
    added.reserve(incoming.size()); // `known` points into it
    for (const auto& span : incoming) {
      auto it = known.find(span.span_id());
      if (it != known.end()) {
        if (!SameSpan(*it->second, span)) {
          throw util::ConflictError("span_id already exists with different content", span.span_id());
        }
        ++out.spans_skipped;
        continue;
      }
      added.push_back(span);
      known.emplace(span.span_id(), &added.back());
    }
    std::vector<Span> forest_input = stored;
    forest_input.insert(forest_input.end(), added.begin(), added.end());
    reconstruction::SpanForest::Build(std::move(forest_input));

    if (!existing) {
      db::model::TraceRecord record;
      record.trace_id        = trace_id;
      record.attributes_json = util::StructToJson(merged);
      record.created_at_ms   = now_ms;
      record.updated_at_ms   = now_ms;
      auto inserted          = repository_->InsertTrace(tx, record);
      if (inserted.code == db::ErrorCode::AlreadyExists) {
        // created by another process since the read; retry on a fresh snapshot
        throw util::TransactionConflict("trace created concurrently: " + trace_id);
      }
      ThrowIfDbError(inserted, "insert trace");
    } else {
      db::model::TraceRecord record = *existing;
      record.attributes_json        = util::StructToJson(merged);
      record.updated_at_ms          = now_ms;
      ThrowIfDbError(repository_->UpdateTrace(tx, record), "update trace");
    }

    std::vector<db::model::SpanRecord> records;
    records.reserve(added.size());
    for (std::size_t i = 0; i < added.size(); ++i) {
      records.push_back(ToRecord(trace_id, added[i], stored.size() + i));
    }
    if (!records.empty()) {
      auto inserted = repository_->InsertSpans(tx, records);
      if (inserted.code == db::ErrorCode::AlreadyExists) {
        throw util::TransactionConflict("spans written concurrently: " + trace_id);
      }
      ThrowIfDbError(inserted, "insert spans");
    }

    if (feedback) {
      Feedback entry = *feedback;
      if (!entry.has_timestamp()) {
        *entry.mutable_timestamp() = util::ToProto(util::Now());
      }
      db::model::FeedbackRecord record;
      record.trace_id      = trace_id;
      record.seq           = repository_->GetFeedback(tx, trace_id).size();
      record.json          = util::MessageToJson(entry);
      record.created_at_ms = now_ms;
      ThrowIfDbError(repository_->AppendFeedback(tx, record), "append feedback");
    }

    out.spans_added = static_cast<int>(added.size());
    out.trace       = LoadTrace(tx, trace_id, true);
    return out;
  });

  observability::Metrics::Instance().RecordSpansIngested(result.spans_added, result.spans_skipped);
  TRACEBRAIN_LOG_DEBUG("trace ingested", {observability::StringField("trace_id", trace_id),
                                          observability::IntField("spans_added", result.spans_added),
                                          observability::IntField("spans_skipped", result.spans_skipped)});
  return result;
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

Trace TraceStore::Get(const std::string& trace_id, const util::Deadline& deadline) {
  deadline.ThrowIfExpired("get");
  auto tx    = repository_->Begin();
  auto trace = LoadTrace(*tx, trace_id, true);
  tx->Commit();
  return trace;
}

TracePage TraceStore::List(const tracebrain::query::v1::TraceFilter& filter, int skip, int limit, const util::Deadline& deadline) {
  CheckPage(skip, limit);
  ValidateFilter(filter);
  deadline.ThrowIfExpired("list");

  auto tx     = repository_->Begin();
  auto traces = LoadAll(*tx, false);
  tx->Commit();
  deadline.ThrowIfExpired("list");

  std::vector<Trace> matched;
  for (auto& trace : traces) {
    if (Matches(filter, trace)) {
      matched.push_back(std::move(trace));
    }
  }
  std::sort(matched.begin(), matched.end(), [](const Trace& a, const Trace& b) {
    const auto lhs = util::ToUnixNanos(a.created_at());
    const auto rhs = util::ToUnixNanos(b.created_at());
    if (lhs != rhs) {
      return lhs > rhs;
    }
    return a.trace_id() < b.trace_id();
  });

  TracePage page;
  page.total  = static_cast<int64_t>(matched.size());
  page.traces = Window(std::move(matched), skip, limit);
  for (auto& trace : page.traces) {
    FillContent(&trace);
  }
  return page;
}

std::vector<Trace> TraceStore::EpisodeTraces(const std::string& episode_id, const util::Deadline& deadline) {
  if (episode_id.empty()) {
    throw util::ValidationError("episode_id is required");
  }
  tracebrain::query::v1::TraceFilter filter;
  filter.set_episode_id(episode_id);

  deadline.ThrowIfExpired("episode_traces");
  auto tx     = repository_->Begin();
  auto traces = LoadAll(*tx, true);
  tx->Commit();

  std::vector<Trace> out;
  for (auto& trace : traces) {
    if (Matches(filter, trace)) {
      out.push_back(std::move(trace));
    }
  }
  if (out.empty()) {
    throw util::NotFound("episode not found: " + episode_id);
  }
  // repository order is creation order, which is the episode's order
  return out;
}

std::vector<Trace> TraceStore::Snapshot(const util::Deadline& deadline) {
  deadline.ThrowIfExpired("snapshot");
  auto tx     = repository_->Begin();
  auto traces = LoadAll(*tx, false);
  tx->Commit();
  return traces;
}

Reconstruction TraceStore::Reconstruct(const std::string& trace_id, const std::string& span_id, const util::Deadline& deadline) {
  deadline.ThrowIfExpired("reconstruct");
  auto tx    = repository_->Begin();
  auto trace = LoadTrace(*tx, trace_id, false);
  tx->Commit();

  std::vector<Span> spans(trace.spans().begin(), trace.spans().end());
  auto              forest = reconstruction::SpanForest::Build(std::move(spans));

  Reconstruction out;
  out.content = forest.Reconstruct(span_id);
  out.path    = forest.PathFromRoot(span_id);
  return out;
}

// ------------------------------------------------------------------
// Feedback ledger
// ------------------------------------------------------------------

Trace TraceStore::AddFeedback(const std::string& trace_id, Feedback feedback, const util::Deadline& deadline) {
  ValidateFeedback(feedback);
  if (!feedback.has_timestamp()) {
    *feedback.mutable_timestamp() = util::ToProto(util::Now());
  }

  std::lock_guard<std::mutex> lock(TraceLock(trace_id));

  return Mutate("add_feedback", deadline, [&](db::Transaction& tx) {
    if (!repository_->GetTrace(tx, trace_id)) {
      throw util::NotFound("trace not found: " + trace_id);
    }
    db::model::FeedbackRecord record;
    record.trace_id      = trace_id;
    record.seq           = repository_->GetFeedback(tx, trace_id).size();
    record.json          = util::MessageToJson(feedback);
    record.created_at_ms = util::ToUnixMillis(util::Now());
    ThrowIfDbError(repository_->AppendFeedback(tx, record), "append feedback");
    return LoadTrace(tx, trace_id, true);
  });
}

// ------------------------------------------------------------------
// Review queue
// ------------------------------------------------------------------

ReviewSignal TraceStore::Signal(const std::string& trace_id, const std::string& reason, const util::Deadline& deadline) {
  if (reason.empty()) {
    throw util::ValidationError("signal reason is required");
  }

  std::lock_guard<std::mutex> lock(TraceLock(trace_id));

  auto signal = Mutate("signal", deadline, [&](db::Transaction& tx) {
    auto record = repository_->GetTrace(tx, trace_id);
    if (!record) {
      throw util::NotFound("trace not found: " + trace_id);
    }
    const auto now_ms = util::ToUnixMillis(util::Now());

    auto attributes = util::JsonToStruct(record->attributes_json);
    (*attributes.mutable_fields())[schema::keys::TRACE_STATUS].set_string_value(
        std::string(schema::ToString(schema::TraceStatus::kNeedsReview)));
    record->attributes_json = util::StructToJson(attributes);
    record->updated_at_ms   = now_ms;
    ThrowIfDbError(repository_->UpdateTrace(tx, *record), "update trace");

    db::model::ReviewSignalRecord signal_record;
    signal_record.trace_id      = trace_id;
    signal_record.reason        = reason;
    signal_record.created_at_ms = now_ms;
    ThrowIfDbError(repository_->AppendReviewSignal(tx, signal_record), "append review signal");
    return ToSignal(signal_record);
  });

  TRACEBRAIN_LOG_INFO("trace flagged for review", {observability::StringField("trace_id", trace_id),
                                                   observability::StringField("reason", reason)});
  return signal;
}

ReviewPage TraceStore::ListReviewQueue(int skip, int limit, const util::Deadline& deadline) {
  CheckPage(skip, limit);
  deadline.ThrowIfExpired("review_queue");

  auto tx      = repository_->Begin();
  auto records = repository_->ListReviewSignals(*tx);
  tx->Commit();

  std::vector<ReviewSignal> signals;
  signals.reserve(records.size());
  for (auto it = records.rbegin(); it != records.rend(); ++it) {
    signals.push_back(ToSignal(*it));
  }

  ReviewPage page;
  page.total   = static_cast<int64_t>(signals.size());
  page.signals = Window(std::move(signals), skip, limit);
  return page;
}

// ------------------------------------------------------------------
// Evaluation
// ------------------------------------------------------------------

Trace TraceStore::SetEvaluation(const std::string& trace_id, const schema::Evaluation& evaluation, const util::Deadline& deadline) {
  // round-trip through the parser so stored blocks always satisfy the schema
  const auto value = schema::EvaluationToValue(evaluation);
  schema::ParseEvaluation(value);

  std::lock_guard<std::mutex> lock(TraceLock(trace_id));

  return Mutate("set_evaluation", deadline, [&](db::Transaction& tx) {
    auto record = repository_->GetTrace(tx, trace_id);
    if (!record) {
      throw util::NotFound("trace not found: " + trace_id);
    }
    auto attributes                                                = util::JsonToStruct(record->attributes_json);
    (*attributes.mutable_fields())[schema::keys::AI_EVALUATION] = value;
    record->attributes_json                                        = util::StructToJson(attributes);
    record->updated_at_ms                                          = util::ToUnixMillis(util::Now());
    ThrowIfDbError(repository_->UpdateTrace(tx, *record), "update trace");
    return LoadTrace(tx, trace_id, true);
  });
}

} // namespace tracebrain::core
