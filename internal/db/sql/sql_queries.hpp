#pragma once

namespace tracebrain::db::sql {

/*
  SQL used by the SQLite backend. The Postgres backend prepares the same
  statements with $n placeholders in PgPool::PrepareStatements.
*/

// traces

static constexpr const char* INSERT_TRACE =
    "INSERT INTO traces(trace_id,attributes,created_at_ms,updated_at_ms)"
    " VALUES(?,?,?,?);";

static constexpr const char* UPDATE_TRACE =
    "UPDATE traces SET attributes=?,updated_at_ms=? WHERE trace_id=?;";

static constexpr const char* SELECT_TRACE =
    "SELECT trace_id,attributes,created_at_ms,updated_at_ms"
    " FROM traces WHERE trace_id=?;";

static constexpr const char* LIST_TRACES =
    "SELECT trace_id,attributes,created_at_ms,updated_at_ms"
    " FROM traces ORDER BY rowid ASC;";

// spans

static constexpr const char* INSERT_SPAN =
    "INSERT INTO spans(trace_id,span_id,parent_id,name,start_time_ns,end_time_ns,attributes,seq)"
    " VALUES(?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_SPANS =
    "SELECT trace_id,span_id,parent_id,name,start_time_ns,end_time_ns,attributes,seq"
    " FROM spans WHERE trace_id=? ORDER BY seq ASC;";

static constexpr const char* LIST_SPANS =
    "SELECT s.trace_id,s.span_id,s.parent_id,s.name,s.start_time_ns,s.end_time_ns,s.attributes,s.seq"
    " FROM spans s JOIN traces t ON t.trace_id=s.trace_id"
    " ORDER BY t.rowid ASC, s.seq ASC;";

// feedback

static constexpr const char* INSERT_FEEDBACK =
    "INSERT INTO feedback(trace_id,seq,json,created_at_ms) VALUES(?,?,?,?);";

static constexpr const char* SELECT_FEEDBACK =
    "SELECT trace_id,seq,json,created_at_ms FROM feedback WHERE trace_id=? ORDER BY seq ASC;";

static constexpr const char* LIST_FEEDBACK =
    "SELECT f.trace_id,f.seq,f.json,f.created_at_ms"
    " FROM feedback f JOIN traces t ON t.trace_id=f.trace_id"
    " ORDER BY t.rowid ASC, f.seq ASC;";

// review queue

static constexpr const char* INSERT_REVIEW_SIGNAL =
    "INSERT INTO review_signals(trace_id,reason,created_at_ms) VALUES(?,?,?);";

static constexpr const char* SELECT_REVIEW_SIGNALS =
    "SELECT trace_id,reason,created_at_ms FROM review_signals WHERE trace_id=? ORDER BY id ASC;";

static constexpr const char* LIST_REVIEW_SIGNALS =
    "SELECT trace_id,reason,created_at_ms FROM review_signals ORDER BY id ASC;";

} // namespace tracebrain::db::sql
