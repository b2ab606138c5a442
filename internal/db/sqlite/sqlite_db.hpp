#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace bidsub::db::sqlite {

/*
  Owns the single sqlite3 connection shared by the job store and the
  audit log.

  The connection is opened in serialized mode. Statements returned by
  Prepare must be finalized by the caller.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Throws std::runtime_error carrying sqlite's message.
  void Exec(const std::string& sql);

  sqlite3_stmt* Prepare(const std::string& sql);

  // Creates the submission tables if missing and checks the columns the
  // repository reads are present.
  void EnsureSchema();

  // One connection runs one transaction at a time; held for its lifetime.
  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

 private:
  void ApplyPragmas();

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace bidsub::db::sqlite
