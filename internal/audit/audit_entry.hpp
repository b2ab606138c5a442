#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <google/protobuf/struct.pb.h>

#include "internal/util/time.hpp"

namespace bidsub::audit {

namespace events {
inline constexpr const char* kCreated          = "created";
inline constexpr const char* kAttemptStarted   = "attempt_started";
inline constexpr const char* kAttemptSucceeded = "attempt_succeeded";
inline constexpr const char* kAttemptFailed    = "attempt_failed";
inline constexpr const char* kRetryScheduled   = "retry_scheduled";
inline constexpr const char* kAbandoned        = "abandoned";
inline constexpr const char* kSubmissionRetry  = "submission_retry";
inline constexpr const char* kDeadlinePassed   = "deadline_passed";
inline constexpr const char* kRecovered        = "recovered";
} // namespace events

/*
  One immutable history record. sequence is assigned by the store on append
  and is strictly increasing per job.
*/
struct AuditLogEntry {
  std::string job_id;
  uint64_t    sequence = 0;

  std::string event_type;
  bool        success = true;

  google::protobuf::Struct   details;
  std::optional<std::string> error_message;

  util::TimePoint timestamp{};
};

} // namespace bidsub::audit
