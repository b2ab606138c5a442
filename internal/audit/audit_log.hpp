#pragma once

#include <string>
#include <vector>

#include "internal/audit/audit_entry.hpp"

namespace bidsub::audit {

/*
  Append-only job history.

  Append never fails silently: a write that cannot be made durable throws
  util::AuditWriteError and the caller must escalate it.
*/
class AuditLog {
 public:
  virtual ~AuditLog() = default;

  // Assigns entry.sequence on success.
  virtual void Append(AuditLogEntry& entry) = 0;

  virtual std::vector<AuditLogEntry> Entries(const std::string& job_id) = 0;
};

} // namespace bidsub::audit
