#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace bidsub::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertJob(Transaction&, const model::JobRecord&) override;
  std::optional<model::JobRecord> GetJob(Transaction&, const std::string&) override;
  std::vector<model::JobRecord> ListJobs(Transaction&) override;
  Result UpdateJob(Transaction&, const model::JobRecord&) override;

  Result AppendAudit(Transaction&, model::AuditRecord&) override;
  std::vector<model::AuditRecord> ListAudit(Transaction&, const std::string&) override;

  Result UpsertRfp(Transaction&, const model::RfpRecord&) override;
  std::optional<model::RfpRecord> GetRfp(Transaction&, const std::string&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
