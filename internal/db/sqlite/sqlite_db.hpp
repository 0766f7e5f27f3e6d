#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace tracebrain::db::sqlite {

/*
  Thin RAII wrapper around one sqlite3 connection.

  The connection is shared by all transactions, so a transaction holds
  TransactionMutex() until it commits or rolls back.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true, int busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (pragmas, schema, transaction control).
  // SQLITE_BUSY and SQLITE_LOCKED throw util::TransactionConflict.
  void Exec(const std::string& sql);

  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

 private:
  void Configure(bool wal_mode, int busy_timeout_ms);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace tracebrain::db::sqlite
