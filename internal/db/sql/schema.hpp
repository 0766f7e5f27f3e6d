#pragma once

#include <array>

namespace tracebrain::db::sql {

static constexpr std::array<const char*, 8> kSqliteSchema = {
    "CREATE TABLE IF NOT EXISTS traces (trace_id TEXT PRIMARY KEY, attributes TEXT NOT NULL, created_at_ms INTEGER NOT NULL,"
    " updated_at_ms INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS spans (trace_id TEXT NOT NULL REFERENCES traces(trace_id), span_id TEXT NOT NULL, parent_id TEXT,"
    " name TEXT NOT NULL, start_time_ns INTEGER NOT NULL, end_time_ns INTEGER NOT NULL, attributes TEXT NOT NULL,"
    " seq INTEGER NOT NULL, PRIMARY KEY (trace_id, span_id));",
    "CREATE INDEX IF NOT EXISTS spans_by_trace_seq ON spans(trace_id, seq);",
    "CREATE TABLE IF NOT EXISTS feedback (trace_id TEXT NOT NULL REFERENCES traces(trace_id), seq INTEGER NOT NULL,"
    " json TEXT NOT NULL, created_at_ms INTEGER NOT NULL, PRIMARY KEY (trace_id, seq));",
    "CREATE TABLE IF NOT EXISTS review_signals (id INTEGER PRIMARY KEY AUTOINCREMENT, trace_id TEXT NOT NULL REFERENCES traces(trace_id),"
    " reason TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",
    "CREATE INDEX IF NOT EXISTS review_signals_by_trace ON review_signals(trace_id, id);",
    "CREATE INDEX IF NOT EXISTS traces_by_created ON traces(created_at_ms);",
    "CREATE TABLE IF NOT EXISTS tracebrain_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
};

static constexpr std::array<const char*, 8> kPostgresSchema = {
    "CREATE TABLE IF NOT EXISTS traces (trace_id TEXT PRIMARY KEY, attributes JSONB NOT NULL, created_at_ms BIGINT NOT NULL,"
    " updated_at_ms BIGINT NOT NULL, row_order BIGSERIAL);",
    "CREATE TABLE IF NOT EXISTS spans (trace_id TEXT NOT NULL REFERENCES traces(trace_id), span_id TEXT NOT NULL, parent_id TEXT,"
    " name TEXT NOT NULL, start_time_ns BIGINT NOT NULL, end_time_ns BIGINT NOT NULL, attributes JSONB NOT NULL,"
    " seq BIGINT NOT NULL, PRIMARY KEY (trace_id, span_id));",
    "CREATE INDEX IF NOT EXISTS spans_by_trace_seq ON spans(trace_id, seq);",
    "CREATE TABLE IF NOT EXISTS feedback (trace_id TEXT NOT NULL REFERENCES traces(trace_id), seq BIGINT NOT NULL,"
    " json JSONB NOT NULL, created_at_ms BIGINT NOT NULL, PRIMARY KEY (trace_id, seq));",
    "CREATE TABLE IF NOT EXISTS review_signals (id BIGSERIAL PRIMARY KEY, trace_id TEXT NOT NULL REFERENCES traces(trace_id),"
    " reason TEXT NOT NULL, created_at_ms BIGINT NOT NULL);",
    "CREATE INDEX IF NOT EXISTS review_signals_by_trace ON review_signals(trace_id, id);",
    "CREATE INDEX IF NOT EXISTS traces_by_created ON traces(created_at_ms);",
    "CREATE TABLE IF NOT EXISTS tracebrain_schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW());",
};

} // namespace tracebrain::db::sql
