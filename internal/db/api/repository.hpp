#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/audit_record.hpp"
#include "internal/db/model/job_record.hpp"
#include "internal/db/model/rfp_record.hpp"

namespace bidsub::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Audit sequence numbers are assigned inside the transaction and are
    strictly increasing per job
  - Audit rows are never updated or deleted

  The DB is the source of truth for:
    submission jobs
    audit history
    RFP deadlines
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Submission jobs
  // ---------------------------------------------------------------------

  virtual Result InsertJob(Transaction&, const model::JobRecord&) = 0;

  virtual std::optional<model::JobRecord> GetJob(Transaction&, const std::string& job_id) = 0;

  virtual std::vector<model::JobRecord> ListJobs(Transaction&) = 0;

  virtual Result UpdateJob(Transaction&, const model::JobRecord&) = 0;

  // ---------------------------------------------------------------------
  // Audit log (append-only)
  // ---------------------------------------------------------------------

  // Assigns record.sequence.
  virtual Result AppendAudit(Transaction&, model::AuditRecord& record) = 0;

  virtual std::vector<model::AuditRecord> ListAudit(Transaction&, const std::string& job_id) = 0;

  // ---------------------------------------------------------------------
  // RFP opportunities
  // ---------------------------------------------------------------------

  virtual Result UpsertRfp(Transaction&, const model::RfpRecord&) = 0;

  virtual std::optional<model::RfpRecord> GetRfp(Transaction&, const std::string& rfp_id) = 0;
};

} // namespace bidsub::db
