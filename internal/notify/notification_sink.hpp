#pragma once

#include <string>

#include <google/protobuf/struct.pb.h>

namespace bidsub::notify {

namespace events {
inline constexpr const char* kQueued               = "queued";
inline constexpr const char* kSubmissionSuccessful = "submission_successful";
inline constexpr const char* kSubmissionFailed     = "submission_failed";
inline constexpr const char* kDeadlineWarning      = "deadline_warning";
} // namespace events

/*
  Best-effort operator notification.

  Notify may throw; callers log and continue. A notification never changes
  or rolls back the job transition that caused it.
*/
class NotificationSink {
 public:
  virtual ~NotificationSink() = default;

  virtual void Notify(const std::string& event_type, const google::protobuf::Struct& payload) = 0;
};

} // namespace bidsub::notify
