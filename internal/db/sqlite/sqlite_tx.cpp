#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace bidsub::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TransactionMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!open_) return;

  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    BIDSUB_LOG_WARN("sqlite rollback failed", {observability::StringField("path", db_->Path()),
                                               observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  open_ = false;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  open_ = false;
  db_->Exec("ROLLBACK;");
  lock_.unlock();
}

} // namespace bidsub::db::sqlite
