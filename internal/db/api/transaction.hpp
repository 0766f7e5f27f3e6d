#pragma once

namespace tracebrain::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - Reads inside the transaction see its own writes
  - Rollback() discards all writes
  - Destructor rolls back if not committed
  - Commit() throws util::TransactionConflict when a concurrent writer won
    (memory backend); callers may retry with a fresh transaction

  SQLite: BEGIN IMMEDIATE on a connection owned for the transaction's lifetime
  Postgres: pqxx::work
  Memory: snapshot copy + version check on commit
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace tracebrain::db
