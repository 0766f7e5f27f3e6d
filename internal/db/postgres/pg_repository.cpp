#include "pg_repository.hpp"

#include "internal/db/sql/schema.hpp"

namespace tracebrain::db::postgres {

namespace {

model::TraceRecord ReadTrace(const pqxx::row& row) {
  model::TraceRecord r;
  r.trace_id        = row[0].c_str();
  r.attributes_json = row[1].c_str();
  r.created_at_ms   = row[2].as<uint64_t>();
  r.updated_at_ms   = row[3].as<uint64_t>();
  return r;
}

model::SpanRecord ReadSpan(const pqxx::row& row) {
  model::SpanRecord r;
  r.trace_id        = row[0].c_str();
  r.span_id         = row[1].c_str();
  r.parent_id       = row[2].c_str();
  r.name            = row[3].c_str();
  r.start_time_ns   = row[4].as<int64_t>();
  r.end_time_ns     = row[5].as<int64_t>();
  r.attributes_json = row[6].c_str();
  r.seq             = row[7].as<uint64_t>();
  return r;
}

model::FeedbackRecord ReadFeedback(const pqxx::row& row) {
  model::FeedbackRecord r;
  r.trace_id      = row[0].c_str();
  r.seq           = row[1].as<uint64_t>();
  r.json          = row[2].c_str();
  r.created_at_ms = row[3].as<uint64_t>();
  return r;
}

template <typename Row, typename Reader>
std::vector<Row> ReadAll(const pqxx::result& res, Reader reader) {
  std::vector<Row> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(reader(row));
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

void PgRepository::BootstrapSchema(PgPool& pool) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);
  for (const char* ddl : sql::kPostgresSchema) {
    tx.exec(ddl);
  }
  tx.commit();
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Traces
// ------------------------------------------------------------------

Result PgRepository::InsertTrace(Transaction& t, const model::TraceRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_trace", r.trace_id, r.attributes_json, r.created_at_ms, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateTrace(Transaction& t, const model::TraceRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_trace", r.trace_id, r.attributes_json, r.updated_at_ms);
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound, "trace not found: " + r.trace_id);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TraceRecord> PgRepository::GetTrace(Transaction& t, const std::string& trace_id) {
  auto res = TX(t).Work().exec_prepared("get_trace", trace_id);
  if (res.empty()) return std::nullopt;
  return ReadTrace(res[0]);
}

std::vector<model::TraceRecord> PgRepository::ListTraces(Transaction& t) {
  return ReadAll<model::TraceRecord>(TX(t).Work().exec_prepared("list_traces"), ReadTrace);
}

// ------------------------------------------------------------------
// Spans
// ------------------------------------------------------------------

Result PgRepository::InsertSpans(Transaction& t, const std::vector<model::SpanRecord>& records) {
  try {
    auto& work = TX(t).Work();
    for (const auto& r : records) {
      work.exec_prepared("insert_span", r.trace_id, r.span_id, r.parent_id, r.name, r.start_time_ns, r.end_time_ns,
                         r.attributes_json, r.seq);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::SpanRecord> PgRepository::GetSpans(Transaction& t, const std::string& trace_id) {
  return ReadAll<model::SpanRecord>(TX(t).Work().exec_prepared("get_spans", trace_id), ReadSpan);
}

std::vector<model::SpanRecord> PgRepository::ListSpans(Transaction& t) {
  return ReadAll<model::SpanRecord>(TX(t).Work().exec_prepared("list_spans"), ReadSpan);
}

// ------------------------------------------------------------------
// Feedback
// ------------------------------------------------------------------

Result PgRepository::AppendFeedback(Transaction& t, const model::FeedbackRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_feedback", r.trace_id, r.seq, r.json, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::FeedbackRecord> PgRepository::GetFeedback(Transaction& t, const std::string& trace_id) {
  return ReadAll<model::FeedbackRecord>(TX(t).Work().exec_prepared("get_feedback", trace_id), ReadFeedback);
}

std::vector<model::FeedbackRecord> PgRepository::ListFeedback(Transaction& t) {
  return ReadAll<model::FeedbackRecord>(TX(t).Work().exec_prepared("list_feedback"), ReadFeedback);
}

// ------------------------------------------------------------------
// Review queue
// ------------------------------------------------------------------

Result PgRepository::AppendReviewSignal(Transaction& t, const model::ReviewSignalRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_review_signal", r.trace_id, r.reason, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

static model::ReviewSignalRecord ReadSignal(const pqxx::row& row) {
  model::ReviewSignalRecord r;
  r.trace_id      = row[0].c_str();
  r.reason        = row[1].c_str();
  r.created_at_ms = row[2].as<uint64_t>();
  return r;
}

std::vector<model::ReviewSignalRecord> PgRepository::GetReviewSignals(Transaction& t, const std::string& trace_id) {
  return ReadAll<model::ReviewSignalRecord>(TX(t).Work().exec_prepared("get_review_signals", trace_id), ReadSignal);
}

std::vector<model::ReviewSignalRecord> PgRepository::ListReviewSignals(Transaction& t) {
  return ReadAll<model::ReviewSignalRecord>(TX(t).Work().exec_prepared("list_review_signals"), ReadSignal);
}

} // namespace tracebrain::db::postgres
