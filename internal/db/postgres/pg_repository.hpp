#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace tracebrain::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  // Runs the schema DDL on a pooled connection.
  static void BootstrapSchema(PgPool& pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
