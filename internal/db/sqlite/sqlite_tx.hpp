#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace tracebrain::db::sqlite {

/*
  BEGIN IMMEDIATE on the shared connection, serialized in-process by the
  database's transaction mutex until Commit or Rollback. Taking the write
  lock up front means an ingest that read the stored spans cannot be
  overtaken before it appends. Another process holding the lock past the
  busy timeout surfaces as util::TransactionConflict, which callers retry.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  void RollbackLogged();

  std::shared_ptr<SqliteDB> db_;
  std::unique_lock<std::mutex> lock_;
  bool committed_ = false;
  bool finished_ = false;
};

}
