#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "bidsub/v1/bid.pb.h"
#include "bidsub/v1/job.pb.h"
#include "internal/audit/audit_log.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/delivery/delivery_scheduler.hpp"
#include "internal/delivery/delivery_worker.hpp"
#include "internal/model/submission_job.hpp"
#include "internal/notify/notification_sink.hpp"
#include "internal/packaging/package_assembler.hpp"
#include "internal/portal/portal_registry.hpp"
#include "internal/rfp/rfp_lookup.hpp"

namespace bidsub::core {

struct OrchestratorOptions {
  uint32_t max_concurrent_submissions = 4;
  uint32_t default_max_retries        = 3;

  // Queued jobs whose deadline falls inside this window get one warning.
  std::chrono::milliseconds deadline_warning_window{std::chrono::hours(24)};
};

struct SubmitOptions {
  std::optional<util::TimePoint> scheduled_time;
  std::optional<uint32_t>        max_retries;
};

// Portal calls still running, keyed by job id. Shared with the delivery
// threads so a call that outlives its timeout can release its own entry.
struct PendingDeliveries {
  std::mutex                      mutex;
  std::condition_variable         released;
  std::unordered_set<std::string> job_ids;
};

/*
  Owns the submission queue and drives every job through the state machine.

  Concurrency model:
    - jobs_ and in_flight_ are guarded by mutex_. Every transition is
      applied under the exclusive lock; readers take the shared lock.
    - Admission (ProcessQueue) marks jobs in flight under the same lock that
      selected them, so a job is never delivered twice at once.
    - Portal delivery runs on the worker pool outside the lock, bounded by
      the portal's delivery timeout. A call that times out keeps its job in
      pending_ until it returns; such a job is not admitted again and still
      occupies a delivery slot. Lock order is mutex_ then pending_->mutex.
    - Audit entries for a transition are appended before the transition is
      published to jobs_. All repository writes happen under mutex_.
    - Notifications are sent after the lock is released and never affect
      the outcome.

  An audit failure inside a worker latches a fault: the job stays in flight
  and every later ProcessQueue throws AuditWriteError.
*/
class SubmissionOrchestrator final : public delivery::DeliveryExecutor {
 public:
  SubmissionOrchestrator(OrchestratorOptions options, std::shared_ptr<db::Repository> repository,
                         std::shared_ptr<rfp::RfpLookup> rfps, std::shared_ptr<portal::PortalRegistry> portals,
                         std::shared_ptr<packaging::PackageAssembler> assembler, std::shared_ptr<audit::AuditLog> audit,
                         std::shared_ptr<notify::NotificationSink> notifications);
  ~SubmissionOrchestrator() override;

  SubmissionOrchestrator(const SubmissionOrchestrator&)            = delete;
  SubmissionOrchestrator& operator=(const SubmissionOrchestrator&) = delete;

  // Starts max_concurrent_submissions delivery workers.
  void Start();
  void Stop();

  // Loads persisted jobs. Jobs left SUBMITTED by a crash return to QUEUED.
  void Hydrate();

  model::SubmissionJob Submit(const std::string& rfp_id, const bidsub::v1::BidDocument& bid_document, const std::string& portal,
                              int32_t priority, const SubmitOptions& options = {});

  // Admits eligible jobs up to the free capacity; returns the admitted ids
  // in admission order.
  std::vector<std::string> ProcessQueue();

  void ExecuteAttempt(const std::string& job_id) override;

  model::SubmissionJob RetrySubmission(const std::string& job_id);

  bidsub::v1::JobStatus              GetJobStatus(const std::string& job_id) const;
  bidsub::v1::SubmissionStatistics   GetStatistics() const;
  std::vector<bidsub::v1::JobStatus> ListQueue(std::optional<bidsub::v1::SubmissionStatus> status = std::nullopt) const;
  std::vector<audit::AuditLogEntry>  AuditTrail(const std::string& job_id) const;

  // True once nothing is in flight and no timed-out portal call is still
  // running; false on timeout.
  bool WaitForIdle(std::chrono::milliseconds timeout);

  size_t InFlightCount() const;

 private:
  using Notification = std::pair<std::string, google::protobuf::Struct>;

  struct Fault {
    bool        audit = false;
    std::string message;
  };

  // Both run under the exclusive lock.
  void Persist(const model::SubmissionJob& job, bool insert);
  void Audit(const std::string& job_id, const char* event_type, bool success, google::protobuf::Struct details,
             std::optional<std::string> error_message = std::nullopt);

  // Publishes a transition and releases the in-flight mark.
  void FinishLocked(model::SubmissionJob job);

  void RecordAssemblyFailure(const std::string& job_id, const std::string& stage, const std::vector<std::string>& violations);
  void RecordOutcome(const std::string& job_id, const model::DeliveryOutcome& outcome);

  void DispatchNotifications(std::vector<Notification> notifications);

  void LatchFault(const std::string& job_id, bool audit, const std::string& message);

  OrchestratorOptions options_;

  std::shared_ptr<db::Repository>              repository_;
  std::shared_ptr<rfp::RfpLookup>              rfps_;
  std::shared_ptr<portal::PortalRegistry>      portals_;
  std::shared_ptr<packaging::PackageAssembler> assembler_;
  std::shared_ptr<audit::AuditLog>             audit_;
  std::shared_ptr<notify::NotificationSink>    notifications_;

  mutable std::shared_mutex                   mutex_;
  std::condition_variable_any                 idle_cv_;
  std::map<std::string, model::SubmissionJob> jobs_;
  std::unordered_set<std::string>             in_flight_;
  std::optional<Fault>                        fault_;

  std::shared_ptr<PendingDeliveries> pending_ = std::make_shared<PendingDeliveries>();

  std::shared_ptr<delivery::DeliveryScheduler>          scheduler_;
  std::vector<std::unique_ptr<delivery::DeliveryWorker>> workers_;
  std::atomic<bool>                                     started_{false};
};

} // namespace bidsub::core
