#pragma once

#include <memory>

#include "internal/audit/audit_log.hpp"
#include "internal/db/api/repository.hpp"

namespace bidsub::audit {

// Stores entries in submission_audit_log, one transaction per append.
class RepositoryAuditLog final : public AuditLog {
 public:
  explicit RepositoryAuditLog(std::shared_ptr<db::Repository> repository);

  void Append(AuditLogEntry& entry) override;

  std::vector<AuditLogEntry> Entries(const std::string& job_id) override;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace bidsub::audit
