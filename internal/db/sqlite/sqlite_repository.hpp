#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace tracebrain::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // Creates tables and indexes if missing.
  static void BootstrapSchema(SqliteDB& db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
