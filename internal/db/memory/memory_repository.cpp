#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace bidsub::db::memory {

MemoryRepository::MemoryRepository() : committed_(std::make_shared<State>()) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result MemoryRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.jobs.contains(r.job_id)) return Result::Err(ErrorCode::AlreadyExists, "job " + r.job_id);
  s.jobs[r.job_id] = r;
  return Result::Ok();
}

std::optional<model::JobRecord> MemoryRepository::GetJob(Transaction& t, const std::string& job_id) {
  const auto& s  = TX(t).View();
  auto        it = s.jobs.find(job_id);
  if (it == s.jobs.end()) return std::nullopt;
  return it->second;
}

std::vector<model::JobRecord> MemoryRepository::ListJobs(Transaction& t) {
  const auto&                   s = TX(t).View();
  std::vector<model::JobRecord> records;
  records.reserve(s.jobs.size());
  for (const auto& [_, record] : s.jobs) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.jobs.find(r.job_id);
  if (it == s.jobs.end()) return Result::Err(ErrorCode::NotFound, "job " + r.job_id);
  it->second = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result MemoryRepository::AppendAudit(Transaction& t, model::AuditRecord& r) {
  auto& entries = TX(t).Mutable().audit[r.job_id];
  r.sequence    = entries.empty() ? 1 : entries.back().sequence + 1;
  entries.push_back(r);
  return Result::Ok();
}

std::vector<model::AuditRecord> MemoryRepository::ListAudit(Transaction& t, const std::string& job_id) {
  const auto& s  = TX(t).View();
  auto        it = s.audit.find(job_id);
  if (it == s.audit.end()) return {};
  return it->second;
}

// ------------------------------------------------------------------
// RFPs
// ------------------------------------------------------------------

Result MemoryRepository::UpsertRfp(Transaction& t, const model::RfpRecord& r) {
  TX(t).Mutable().rfps[r.rfp_id] = r;
  return Result::Ok();
}

std::optional<model::RfpRecord> MemoryRepository::GetRfp(Transaction& t, const std::string& rfp_id) {
  const auto& s  = TX(t).View();
  auto        it = s.rfps.find(rfp_id);
  if (it == s.rfps.end()) return std::nullopt;
  return it->second;
}

} // namespace bidsub::db::memory
