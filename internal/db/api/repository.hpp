#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/trace_record.hpp"

namespace tracebrain::db {

/*
  Repository abstraction.

  GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Spans and feedback are append-only; nothing is ever deleted
  - GetSpans/GetFeedback return rows in append order (seq ascending)

  The DB is the source of truth for traces, spans, feedback and review
  signals. Validation happens above this layer.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Traces
  // ---------------------------------------------------------------------

  virtual Result InsertTrace(Transaction&, const model::TraceRecord&) = 0;

  // Replaces attributes_json and updated_at_ms.
  virtual Result UpdateTrace(Transaction&, const model::TraceRecord&) = 0;

  virtual std::optional<model::TraceRecord> GetTrace(Transaction&, const std::string& trace_id) = 0;

  virtual std::vector<model::TraceRecord> ListTraces(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Spans
  // ---------------------------------------------------------------------

  virtual Result InsertSpans(Transaction&, const std::vector<model::SpanRecord>&) = 0;

  virtual std::vector<model::SpanRecord> GetSpans(Transaction&, const std::string& trace_id) = 0;

  // All spans of all traces; grouped by trace, seq ascending within a trace.
  virtual std::vector<model::SpanRecord> ListSpans(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Feedback
  // ---------------------------------------------------------------------

  virtual Result AppendFeedback(Transaction&, const model::FeedbackRecord&) = 0;

  virtual std::vector<model::FeedbackRecord> GetFeedback(Transaction&, const std::string& trace_id) = 0;

  virtual std::vector<model::FeedbackRecord> ListFeedback(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Review queue
  // ---------------------------------------------------------------------

  virtual Result AppendReviewSignal(Transaction&, const model::ReviewSignalRecord&) = 0;

  // Oldest first.
  virtual std::vector<model::ReviewSignalRecord> GetReviewSignals(Transaction&, const std::string& trace_id) = 0;

  // Oldest first.
  virtual std::vector<model::ReviewSignalRecord> ListReviewSignals(Transaction&) = 0;
};

} // namespace tracebrain::db
