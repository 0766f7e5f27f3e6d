#pragma once

#include <cstdint>
#include <string>

namespace tracebrain::db::model {

/*
  Persisted rows. Attribute bags and feedback bodies are stored as the JSON
  form of their protobuf messages; the repository never interprets them.
*/

struct TraceRecord {
  std::string trace_id;
  std::string attributes_json;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

struct SpanRecord {
  std::string trace_id;
  std::string span_id;
  std::string parent_id; // empty for roots
  std::string name;

  int64_t start_time_ns = 0;
  int64_t end_time_ns   = 0;

  std::string attributes_json;

  // Position in the trace's ingestion order.
  uint64_t seq = 0;
};

struct FeedbackRecord {
  std::string trace_id;
  uint64_t    seq = 0;
  std::string json;

  uint64_t created_at_ms = 0;
};

struct ReviewSignalRecord {
  std::string trace_id;
  std::string reason;

  uint64_t created_at_ms = 0;
};

} // namespace tracebrain::db::model
