#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace tracebrain::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)), lock_(db_->TransactionMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    RollbackLogged();
  }
}

void SqliteTransaction::Commit() {
  try {
    db_->Exec("COMMIT;");
  } catch (const std::exception&) {
    // a refused COMMIT leaves the transaction open
    RollbackLogged();
    throw;
  }
  committed_ = true;
  finished_  = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  if (finished_) {
    return;
  }
  finished_ = true;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception&) {
    lock_.unlock();
    throw;
  }
  lock_.unlock();
}

void SqliteTransaction::RollbackLogged() {
  finished_ = true;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    TRACEBRAIN_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
  }
  if (lock_.owns_lock()) {
    lock_.unlock();
  }
}

} // namespace tracebrain::db::sqlite
