#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace bidsub::db::sqlite {

/*
  BEGIN IMMEDIATE transaction on the shared connection.

  The write lock is taken up front so an audit append never fails midway
  with SQLITE_BUSY. Transactions on one SqliteDB are serialized through its
  transaction mutex; a thread must not open a second one while it holds
  the first.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;

 private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  bool                         open_ = true;
};

} // namespace bidsub::db::sqlite
