#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace bidsub::db::memory {

class MemoryTransaction;

/*
  In-process job store for tests and single-run deployments.

  Committed state is an immutable snapshot. Transactions read the snapshot
  they started from and copy it on first write; Commit installs the copy
  if no other writer committed in between, else throws.
*/
class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    // ordered so ListJobs is stable across calls
    std::map<std::string, model::JobRecord> jobs;
    std::unordered_map<std::string, std::vector<model::AuditRecord>> audit;
    std::unordered_map<std::string, model::RfpRecord> rfps;
  };

  std::mutex                   mutex_;
  std::shared_ptr<const State> committed_;
  uint64_t                     version_ = 0;
};

} // namespace bidsub::db::memory
