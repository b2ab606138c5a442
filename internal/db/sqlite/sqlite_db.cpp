#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/observability/logging.hpp"

namespace bidsub::db::sqlite {

namespace {

constexpr int kBusyTimeoutMs = 5000;

std::runtime_error SqliteError(sqlite3* db, const std::string& what) {
  return std::runtime_error("sqlite " + what + ": " + (db ? sqlite3_errmsg(db) : "out of memory"));
}

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    auto error = SqliteError(db_, "open " + path_);
    sqlite3_close(db_);
    db_ = nullptr;
    throw error;
  }

  ApplyPragmas();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errmsg(db_);
    sqlite3_free(err);
    throw std::runtime_error("sqlite exec: " + msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    throw SqliteError(db_, "prepare");
  }
  return stmt;
}

void SqliteDB::EnsureSchema() {
  Exec(sql::CREATE_SUBMISSION_JOBS);
  Exec(sql::CREATE_SUBMISSION_AUDIT_LOG);
  Exec(sql::CREATE_RFP_OPPORTUNITIES);

  // fails fast on a database written by an incompatible build
  Exec("SELECT job_id,status,attempts,max_retries,assembly_failures,deadline_warned FROM submission_jobs LIMIT 1;");
  Exec("SELECT job_id,sequence,event_type,success FROM submission_audit_log LIMIT 1;");
  Exec("SELECT rfp_id,response_deadline_ms FROM rfp_opportunities LIMIT 1;");

  BIDSUB_LOG_INFO("sqlite schema ready", {observability::StringField("path", path_)});
}

void SqliteDB::ApplyPragmas() {
  Exec("PRAGMA journal_mode=WAL;");

  // audit entries must survive power loss once Commit returns
  Exec("PRAGMA synchronous=FULL;");

  Exec("PRAGMA foreign_keys=ON;");

  if (sqlite3_busy_timeout(db_, kBusyTimeoutMs) != SQLITE_OK) {
    throw SqliteError(db_, "busy_timeout");
  }
}

} // namespace bidsub::db::sqlite
