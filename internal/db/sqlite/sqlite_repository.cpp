#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/schema.hpp"
#include "internal/db/sql/sql_queries.hpp"

namespace tracebrain::db::sqlite {

using tracebrain::db::ErrorCode;
using tracebrain::db::Result;

namespace {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

// Read paths have no Result to carry errors, so prepare failures throw.
Statement Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Statement(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindNullableText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
  } else {
    BindText(st, idx, s);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

model::TraceRecord ReadTrace(sqlite3_stmt* st) {
  model::TraceRecord r;
  r.trace_id        = ColText(st, 0);
  r.attributes_json = ColText(st, 1);
  r.created_at_ms   = ColU64(st, 2);
  r.updated_at_ms   = ColU64(st, 3);
  return r;
}

model::SpanRecord ReadSpan(sqlite3_stmt* st) {
  model::SpanRecord r;
  r.trace_id        = ColText(st, 0);
  r.span_id         = ColText(st, 1);
  r.parent_id       = ColText(st, 2);
  r.name            = ColText(st, 3);
  r.start_time_ns   = ColI64(st, 4);
  r.end_time_ns     = ColI64(st, 5);
  r.attributes_json = ColText(st, 6);
  r.seq             = ColU64(st, 7);
  return r;
}

model::FeedbackRecord ReadFeedback(sqlite3_stmt* st) {
  model::FeedbackRecord r;
  r.trace_id      = ColText(st, 0);
  r.seq           = ColU64(st, 1);
  r.json          = ColText(st, 2);
  r.created_at_ms = ColU64(st, 3);
  return r;
}

template <typename Row, typename Reader>
std::vector<Row> ReadAll(sqlite3* db, sqlite3_stmt* st, Reader reader) {
  std::vector<Row> out;
  int              rc = SQLITE_OK;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(reader(st));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
  for (const char* ddl : sql::kSqliteSchema) {
    db.Exec(ddl);
  }
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE)
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Traces
// ------------------------------------------------------------------

Result SqliteRepository::InsertTrace(Transaction& t, const model::TraceRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql::INSERT_TRACE, -1, &raw, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Statement st(raw);

  BindText(raw, 1, r.trace_id);
  BindText(raw, 2, r.attributes_json);
  BindU64(raw, 3, r.created_at_ms);
  BindU64(raw, 4, r.updated_at_ms);

  return Translate(db, sqlite3_step(raw));
}

Result SqliteRepository::UpdateTrace(Transaction& t, const model::TraceRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql::UPDATE_TRACE, -1, &raw, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Statement st(raw);

  BindText(raw, 1, r.attributes_json);
  BindU64(raw, 2, r.updated_at_ms);
  BindText(raw, 3, r.trace_id);

  auto result = Translate(db, sqlite3_step(raw));
  if (result && sqlite3_changes(db) == 0)
    return Result::Err(ErrorCode::NotFound, "trace not found: " + r.trace_id);
  return result;
}

std::optional<model::TraceRecord> SqliteRepository::GetTrace(Transaction& t, const std::string& trace_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_TRACE);
  BindText(st.get(), 1, trace_id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  return ReadTrace(st.get());
}

std::vector<model::TraceRecord> SqliteRepository::ListTraces(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::LIST_TRACES);
  return ReadAll<model::TraceRecord>(db, st.get(), ReadTrace);
}

// ------------------------------------------------------------------
// Spans
// ------------------------------------------------------------------

Result SqliteRepository::InsertSpans(Transaction& t, const std::vector<model::SpanRecord>& records) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql::INSERT_SPAN, -1, &raw, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Statement st(raw);

  for (const auto& r : records) {
    sqlite3_reset(raw);
    sqlite3_clear_bindings(raw);

    BindText(raw, 1, r.trace_id);
    BindText(raw, 2, r.span_id);
    BindNullableText(raw, 3, r.parent_id);
    BindText(raw, 4, r.name);
    BindI64(raw, 5, r.start_time_ns);
    BindI64(raw, 6, r.end_time_ns);
    BindText(raw, 7, r.attributes_json);
    BindU64(raw, 8, r.seq);

    auto result = Translate(db, sqlite3_step(raw));
    if (!result) return result;
  }
  return Result::Ok();
}

std::vector<model::SpanRecord> SqliteRepository::GetSpans(Transaction& t, const std::string& trace_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_SPANS);
  BindText(st.get(), 1, trace_id);
  return ReadAll<model::SpanRecord>(db, st.get(), ReadSpan);
}

std::vector<model::SpanRecord> SqliteRepository::ListSpans(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::LIST_SPANS);
  return ReadAll<model::SpanRecord>(db, st.get(), ReadSpan);
}

// ------------------------------------------------------------------
// Feedback
// ------------------------------------------------------------------

Result SqliteRepository::AppendFeedback(Transaction& t, const model::FeedbackRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql::INSERT_FEEDBACK, -1, &raw, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Statement st(raw);

  BindText(raw, 1, r.trace_id);
  BindU64(raw, 2, r.seq);
  BindText(raw, 3, r.json);
  BindU64(raw, 4, r.created_at_ms);

  return Translate(db, sqlite3_step(raw));
}

std::vector<model::FeedbackRecord> SqliteRepository::GetFeedback(Transaction& t, const std::string& trace_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_FEEDBACK);
  BindText(st.get(), 1, trace_id);
  return ReadAll<model::FeedbackRecord>(db, st.get(), ReadFeedback);
}

std::vector<model::FeedbackRecord> SqliteRepository::ListFeedback(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::LIST_FEEDBACK);
  return ReadAll<model::FeedbackRecord>(db, st.get(), ReadFeedback);
}

// ------------------------------------------------------------------
// Review queue
// ------------------------------------------------------------------

Result SqliteRepository::AppendReviewSignal(Transaction& t, const model::ReviewSignalRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql::INSERT_REVIEW_SIGNAL, -1, &raw, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Statement st(raw);

  BindText(raw, 1, r.trace_id);
  BindText(raw, 2, r.reason);
  BindU64(raw, 3, r.created_at_ms);

  return Translate(db, sqlite3_step(raw));
}

static model::ReviewSignalRecord ReadSignal(sqlite3_stmt* row) {
  model::ReviewSignalRecord r;
  r.trace_id      = ColText(row, 0);
  r.reason        = ColText(row, 1);
  r.created_at_ms = ColU64(row, 2);
  return r;
}

std::vector<model::ReviewSignalRecord> SqliteRepository::GetReviewSignals(Transaction& t, const std::string& trace_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_REVIEW_SIGNALS);
  BindText(st.get(), 1, trace_id);
  return ReadAll<model::ReviewSignalRecord>(db, st.get(), ReadSignal);
}

std::vector<model::ReviewSignalRecord> SqliteRepository::ListReviewSignals(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::LIST_REVIEW_SIGNALS);
  return ReadAll<model::ReviewSignalRecord>(db, st.get(), ReadSignal);
}

} // namespace tracebrain::db::sqlite
