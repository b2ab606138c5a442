#include "repository_audit_log.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace bidsub::audit {

RepositoryAuditLog::RepositoryAuditLog(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void RepositoryAuditLog::Append(AuditLogEntry& entry) {
  db::model::AuditRecord record;
  record.job_id        = entry.job_id;
  record.event_type    = entry.event_type;
  record.success       = entry.success;
  record.has_error     = entry.error_message.has_value();
  record.error_message = entry.error_message.value_or("");
  record.timestamp_ms  = util::ToUnixMillis(entry.timestamp);

  auto status = google::protobuf::util::MessageToJsonString(entry.details, &record.details_json);
  if (!status.ok()) {
    throw util::AuditWriteError("audit details for job " + entry.job_id + " not encodable: " + std::string(status.message()));
  }

  try {
    auto tx = repository_->Begin();

    auto result = repository_->AppendAudit(*tx, record);
    if (!result) {
      tx->Rollback();
      throw util::AuditWriteError("audit append failed for job " + entry.job_id + ": " + result.Describe());
    }

    tx->Commit();
  } catch (const util::AuditWriteError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::AuditWriteError("audit append failed for job " + entry.job_id + ": " + e.what());
  }

  entry.sequence = record.sequence;
}

std::vector<AuditLogEntry> RepositoryAuditLog::Entries(const std::string& job_id) {
  auto tx      = repository_->Begin();
  auto records = repository_->ListAudit(*tx, job_id);
  tx->Commit();

  std::vector<AuditLogEntry> out;
  out.reserve(records.size());

  for (auto& record : records) {
    AuditLogEntry entry;
    entry.job_id     = record.job_id;
    entry.sequence   = record.sequence;
    entry.event_type = record.event_type;
    entry.success    = record.success;
    entry.timestamp  = util::FromUnixMillis(record.timestamp_ms);
    if (record.has_error) entry.error_message = record.error_message;

    if (!record.details_json.empty()) {
      auto status = google::protobuf::util::JsonStringToMessage(record.details_json, &entry.details);
      if (!status.ok()) {
        BIDSUB_LOG_WARN("unreadable audit details",
                        {observability::StringField("job_id", job_id), observability::IntField("sequence", static_cast<int64_t>(record.sequence))});
      }
    }

    out.push_back(std::move(entry));
  }
  return out;
}

} // namespace bidsub::audit
