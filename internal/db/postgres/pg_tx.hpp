#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace tracebrain::db::postgres {

/*
  One pooled connection held for the transaction's lifetime.

  Runs at REPEATABLE READ so an ingest sees one snapshot of the trace's
  spans while it assigns seq numbers; a concurrent writer surfaces as a
  serialization failure on commit.
*/
class PgTransaction final : public db::Transaction {
public:
  using Snapshot = pqxx::transaction<pqxx::isolation_level::repeatable_read>;

  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction();

  Snapshot& Work() { return *tx_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<Snapshot> tx_;
  bool committed_ = false;
  bool finished_ = false;
};

}
