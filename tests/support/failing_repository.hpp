#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"

namespace bidsub::testing {

/*
  Memory repository whose writes can be switched to fail.

  fail_audit makes AppendAudit return IOError; fail_jobs does the same for
  InsertJob and UpdateJob.
*/
class FailingRepository final : public db::Repository {
 public:
  std::atomic<bool> fail_audit{false};
  std::atomic<bool> fail_jobs{false};

  std::unique_ptr<db::Transaction> Begin() override {
    return inner_.Begin();
  }

  db::Result InsertJob(db::Transaction& tx, const db::model::JobRecord& r) override {
    if (fail_jobs) return db::Result::Err(db::ErrorCode::IOError, "disk full");
    return inner_.InsertJob(tx, r);
  }

  std::optional<db::model::JobRecord> GetJob(db::Transaction& tx, const std::string& id) override {
    return inner_.GetJob(tx, id);
  }

  std::vector<db::model::JobRecord> ListJobs(db::Transaction& tx) override {
    return inner_.ListJobs(tx);
  }

  db::Result UpdateJob(db::Transaction& tx, const db::model::JobRecord& r) override {
    if (fail_jobs) return db::Result::Err(db::ErrorCode::IOError, "disk full");
    return inner_.UpdateJob(tx, r);
  }

  db::Result AppendAudit(db::Transaction& tx, db::model::AuditRecord& r) override {
    if (fail_audit) return db::Result::Err(db::ErrorCode::IOError, "audit volume offline");
    return inner_.AppendAudit(tx, r);
  }

  std::vector<db::model::AuditRecord> ListAudit(db::Transaction& tx, const std::string& id) override {
    return inner_.ListAudit(tx, id);
  }

  db::Result UpsertRfp(db::Transaction& tx, const db::model::RfpRecord& r) override {
    return inner_.UpsertRfp(tx, r);
  }

  std::optional<db::model::RfpRecord> GetRfp(db::Transaction& tx, const std::string& id) override {
    return inner_.GetRfp(tx, id);
  }

 private:
  db::memory::MemoryRepository inner_;
};

} // namespace bidsub::testing
