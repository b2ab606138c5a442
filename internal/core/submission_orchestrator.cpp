#include "submission_orchestrator.hpp"

#include <algorithm>
#include <future>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>

#include "internal/config/portal_profiles.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace bidsub::core {

using namespace bidsub::v1;
using google::protobuf::Struct;
using google::protobuf::Value;

namespace events = bidsub::audit::events;

namespace {

Value StringValue(const std::string& value) {
  Value v;
  v.set_string_value(value);
  return v;
}

Value NumberValue(double value) {
  Value v;
  v.set_number_value(value);
  return v;
}

Value ListValue(const std::vector<std::string>& values) {
  Value v;
  auto* list = v.mutable_list_value();
  for (const auto& value : values) {
    list->add_values()->set_string_value(value);
  }
  return v;
}

Struct MakeStruct(std::initializer_list<std::pair<const char*, Value>> fields) {
  Struct s;
  for (const auto& [key, value] : fields) {
    (*s.mutable_fields())[key] = value;
  }
  return s;
}

std::string Join(const std::vector<std::string>& parts, const char* separator) {
  std::string out;
  for (const auto& part : parts) {
    if (!out.empty()) out += separator;
    out += part;
  }
  return out;
}

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFoundError(message);
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::Conflict:
      throw util::InvalidStateError(message);
    default:
      throw std::runtime_error(message);
  }
}

void Transition(model::SubmissionJob& job, SubmissionStatus to) {
  if (!model::CanTransition(job.status, to)) {
    throw util::InvalidStateError("job " + job.job_id + ": illegal transition " + model::StatusName(job.status) + " -> " +
                                  model::StatusName(to));
  }
  job.status = to;
}

// Most urgent first: priority desc, deadline asc, then creation order.
bool QueueOrder(const model::SubmissionJob& a, const model::SubmissionJob& b) {
  if (a.priority != b.priority) return a.priority > b.priority;
  if (a.deadline != b.deadline) return a.deadline < b.deadline;
  if (a.created_at != b.created_at) return a.created_at < b.created_at;
  return a.job_id < b.job_id;
}

db::model::JobRecord ToRecord(const model::SubmissionJob& job) {
  db::model::JobRecord record;
  record.job_id = job.job_id;
  record.rfp_id = job.rfp_id;
  record.portal = job.portal;
  if (!job.bid_document.SerializeToString(&record.bid_document)) {
    throw std::runtime_error("job " + job.job_id + ": bid document not serializable");
  }

  record.status            = job.status;
  record.priority          = job.priority;
  record.deadline_ms       = util::ToUnixMillis(job.deadline);
  record.scheduled_time_ms = job.scheduled_time ? util::ToUnixMillis(*job.scheduled_time) : 0;

  record.attempts          = job.attempts;
  record.max_retries       = job.max_retries;
  record.assembly_failures = job.assembly_failures;

  record.confirmation_number = job.confirmation_number.value_or("");
  record.submitted_at_ms     = job.submitted_at ? util::ToUnixMillis(*job.submitted_at) : 0;
  record.confirmed_at_ms     = job.confirmed_at ? util::ToUnixMillis(*job.confirmed_at) : 0;
  record.last_error          = job.last_error;

  record.created_at_ms   = util::ToUnixMillis(job.created_at);
  record.updated_at_ms   = util::ToUnixMillis(job.updated_at);
  record.deadline_warned = job.deadline_warned;
  return record;
}

model::SubmissionJob FromRecord(const db::model::JobRecord& record) {
  model::SubmissionJob job;
  job.job_id = record.job_id;
  job.rfp_id = record.rfp_id;
  job.portal = record.portal;
  if (!job.bid_document.ParseFromString(record.bid_document)) {
    throw std::runtime_error("job " + record.job_id + ": stored bid document is corrupt");
  }

  job.status   = static_cast<SubmissionStatus>(record.status);
  job.priority = record.priority;
  job.deadline = util::FromUnixMillis(record.deadline_ms);
  if (record.scheduled_time_ms) job.scheduled_time = util::FromUnixMillis(record.scheduled_time_ms);

  job.attempts          = record.attempts;
  job.max_retries       = record.max_retries;
  job.assembly_failures = record.assembly_failures;

  if (!record.confirmation_number.empty()) job.confirmation_number = record.confirmation_number;
  if (record.submitted_at_ms) job.submitted_at = util::FromUnixMillis(record.submitted_at_ms);
  if (record.confirmed_at_ms) job.confirmed_at = util::FromUnixMillis(record.confirmed_at_ms);
  job.last_error = record.last_error;

  job.created_at      = util::FromUnixMillis(record.created_at_ms);
  job.updated_at      = util::FromUnixMillis(record.updated_at_ms);
  job.deadline_warned = record.deadline_warned;
  return job;
}

JobStatus ToStatus(const model::SubmissionJob& job, bool in_flight) {
  JobStatus status;
  status.set_job_id(job.job_id);
  status.set_rfp_id(job.rfp_id);
  status.set_portal(job.portal);
  status.set_status(job.status);
  status.set_priority(job.priority);
  status.set_attempts(job.attempts);
  status.set_max_retries(job.max_retries);
  status.set_assembly_failures(job.assembly_failures);

  *status.mutable_deadline()   = util::ToProto(job.deadline);
  *status.mutable_created_at() = util::ToProto(job.created_at);
  if (job.scheduled_time) *status.mutable_scheduled_time() = util::ToProto(*job.scheduled_time);
  if (job.submitted_at) *status.mutable_submitted_at() = util::ToProto(*job.submitted_at);
  if (job.confirmed_at) *status.mutable_confirmed_at() = util::ToProto(*job.confirmed_at);

  if (job.confirmation_number) status.set_confirmation_number(*job.confirmation_number);
  status.set_last_error(job.last_error);
  status.set_in_flight(in_flight);
  return status;
}

Struct JobPayload(const model::SubmissionJob& job) {
  auto payload = MakeStruct({{"job_id", StringValue(job.job_id)},
                             {"rfp_id", StringValue(job.rfp_id)},
                             {"portal", StringValue(job.portal)},
                             {"status", StringValue(model::StatusName(job.status))},
                             {"attempts", NumberValue(job.attempts)},
                             {"deadline", StringValue(util::FormatTime(job.deadline))}});
  if (job.confirmation_number) {
    (*payload.mutable_fields())["confirmation_number"] = StringValue(*job.confirmation_number);
  }
  if (!job.last_error.empty()) {
    (*payload.mutable_fields())["error"] = StringValue(job.last_error);
  }
  return payload;
}

/*
  Runs adapter->Submit on its own thread and waits at most `timeout`.

  The job id stays in `pending` until the adapter call returns, even when
  the wait gives up first; the call thread owns copies of everything it
  touches and releases the id itself. Any exception from the adapter is
  retryable.
*/
model::DeliveryOutcome DeliverWithTimeout(std::shared_ptr<portal::PortalAdapter> adapter, model::BidDocumentPackage package,
                                          std::chrono::milliseconds timeout, const std::string& job_id,
                                          const std::shared_ptr<PendingDeliveries>& pending) {
  auto promise = std::make_shared<std::promise<model::DeliveryOutcome>>();
  auto future  = promise->get_future();

  {
    std::lock_guard lock(pending->mutex);
    pending->job_ids.insert(job_id);
  }

  try {
    std::thread([adapter = std::move(adapter), package = std::move(package), promise, pending, job_id]() {
      model::DeliveryOutcome outcome;
      try {
        outcome = adapter->Submit(package);
      } catch (const std::exception& e) {
        outcome = model::DeliveryOutcome::Retryable(std::string("adapter error: ") + e.what());
      }

      {
        std::lock_guard lock(pending->mutex);
        pending->job_ids.erase(job_id);
      }
      pending->released.notify_all();
      promise->set_value(std::move(outcome));
    }).detach();
  } catch (const std::system_error&) {
    {
      std::lock_guard lock(pending->mutex);
      pending->job_ids.erase(job_id);
    }
    pending->released.notify_all();
    throw;
  }

  if (future.wait_for(timeout) == std::future_status::timeout) {
    BIDSUB_LOG_WARN("delivery timed out; portal call still running",
                    {observability::StringField("job_id", job_id), observability::IntField("timeout_ms", timeout.count())});
    return model::DeliveryOutcome::Retryable("delivery timed out after " + std::to_string(timeout.count()) + "ms");
  }

  return future.get();
}

} // namespace

SubmissionOrchestrator::SubmissionOrchestrator(OrchestratorOptions options, std::shared_ptr<db::Repository> repository,
                                               std::shared_ptr<rfp::RfpLookup> rfps, std::shared_ptr<portal::PortalRegistry> portals,
                                               std::shared_ptr<packaging::PackageAssembler> assembler,
                                               std::shared_ptr<audit::AuditLog>             audit,
                                               std::shared_ptr<notify::NotificationSink>    notifications)
    : options_(options),
      repository_(std::move(repository)),
      rfps_(std::move(rfps)),
      portals_(std::move(portals)),
      assembler_(std::move(assembler)),
      audit_(std::move(audit)),
      notifications_(std::move(notifications)) {
  if (options_.max_concurrent_submissions == 0) {
    throw std::invalid_argument("max_concurrent_submissions must be positive");
  }
}

SubmissionOrchestrator::~SubmissionOrchestrator() {
  Stop();
}

// ------------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------------

void SubmissionOrchestrator::Start() {
  if (started_.exchange(true)) return;

  scheduler_ = std::make_shared<delivery::DeliveryScheduler>();
  for (uint32_t i = 0; i < options_.max_concurrent_submissions; ++i) {
    auto worker = std::make_unique<delivery::DeliveryWorker>(scheduler_, *this);
    worker->Start();
    workers_.push_back(std::move(worker));
  }

  BIDSUB_LOG_INFO("delivery workers started", {observability::IntField("workers", options_.max_concurrent_submissions)});
}

void SubmissionOrchestrator::Stop() {
  if (!started_.exchange(false)) return;

  for (auto& worker : workers_) {
    worker->Stop();
  }
  workers_.clear();

  BIDSUB_LOG_INFO("delivery workers stopped");
}

void SubmissionOrchestrator::Hydrate() {
  std::vector<Notification> notifications;
  std::unique_lock          lock(mutex_);

  {
    std::lock_guard pending_lock(pending_->mutex);
    if (!in_flight_.empty() || !pending_->job_ids.empty()) {
      throw util::InvalidStateError("cannot hydrate while deliveries are in flight");
    }
  }

  std::vector<db::model::JobRecord> records;
  {
    auto tx = repository_->Begin();
    records = repository_->ListJobs(*tx);
    tx->Commit();
  }

  std::map<std::string, model::SubmissionJob> loaded;
  size_t                                      recovered = 0;
  size_t                                      abandoned = 0;

  for (const auto& record : records) {
    auto job = FromRecord(record);

    if (job.status == SUBMISSION_STATUS_SUBMITTED) {
      Audit(job.job_id, events::kRecovered, true,
            MakeStruct({{"attempt", NumberValue(job.attempts)}, {"previous_status", StringValue("submitted")}}));
      job.updated_at = util::Now();

      // The interrupted attempt was the last one the budget allowed.
      if (job.attempts > job.max_retries) {
        job.last_error = "delivery interrupted on final attempt " + std::to_string(job.attempts);
        Audit(job.job_id, events::kAbandoned, false,
              MakeStruct({{"attempts", NumberValue(job.attempts)}, {"reason", StringValue("interrupted on final attempt")}}),
              job.last_error);
        Transition(job, SUBMISSION_STATUS_FAILED);
        notifications.emplace_back(notify::events::kSubmissionFailed, JobPayload(job));
        ++abandoned;
      } else {
        Transition(job, SUBMISSION_STATUS_QUEUED);
        ++recovered;
      }
      Persist(job, false);
    }

    loaded.emplace(job.job_id, std::move(job));
  }

  jobs_ = std::move(loaded);

  BIDSUB_LOG_INFO("jobs hydrated", {observability::IntField("jobs", static_cast<int64_t>(jobs_.size())),
                                    observability::IntField("recovered", static_cast<int64_t>(recovered)),
                                    observability::IntField("abandoned", static_cast<int64_t>(abandoned))});
  lock.unlock();

  DispatchNotifications(std::move(notifications));
}

// ------------------------------------------------------------------
// Submission
// ------------------------------------------------------------------

model::SubmissionJob SubmissionOrchestrator::Submit(const std::string& rfp_id, const BidDocument& bid_document,
                                                    const std::string& portal, int32_t priority, const SubmitOptions& options) {
  auto rfp = rfps_->Find(rfp_id);
  if (!rfp) {
    throw util::InvalidReferenceError("unknown rfp: " + rfp_id);
  }

  auto entry = portals_->Find(portal);
  if (!entry) {
    throw util::InvalidReferenceError("unknown portal: " + portal);
  }

  const auto now = util::Now();
  if (rfp->response_deadline <= now) {
    throw util::PastDeadlineError("rfp " + rfp_id + " deadline passed at " + util::FormatTime(rfp->response_deadline));
  }

  model::SubmissionJob job;
  job.job_id       = util::GenerateUUIDString();
  job.rfp_id       = rfp_id;
  job.portal       = portal;
  job.bid_document = bid_document;
  if (job.bid_document.rfp_id().empty()) job.bid_document.set_rfp_id(rfp_id);
  if (job.bid_document.solicitation_number().empty()) job.bid_document.set_solicitation_number(rfp->solicitation_number);

  job.deadline       = rfp->response_deadline;
  job.priority       = priority;
  job.scheduled_time = options.scheduled_time;
  job.status         = SUBMISSION_STATUS_QUEUED;
  job.max_retries    = options.max_retries.value_or(entry->requirements.max_retries.value_or(options_.default_max_retries));
  job.created_at     = now;
  job.updated_at     = now;

  {
    std::unique_lock lock(mutex_);

    Audit(job.job_id, events::kCreated, true,
          MakeStruct({{"rfp_id", StringValue(rfp_id)},
                      {"portal", StringValue(portal)},
                      {"priority", NumberValue(priority)},
                      {"max_retries", NumberValue(job.max_retries)},
                      {"deadline", StringValue(util::FormatTime(job.deadline))}}));
    Persist(job, true);
    jobs_.emplace(job.job_id, job);
  }

  BIDSUB_LOG_INFO("job queued", {observability::StringField("job_id", job.job_id), observability::StringField("rfp_id", rfp_id),
                                 observability::StringField("portal", portal), observability::IntField("priority", priority)});

  DispatchNotifications({{notify::events::kQueued, JobPayload(job)}});
  return job;
}

// ------------------------------------------------------------------
// Scheduling
// ------------------------------------------------------------------

std::vector<std::string> SubmissionOrchestrator::ProcessQueue() {
  std::vector<std::string>  admitted;
  std::vector<Notification> notifications;

  {
    std::unique_lock lock(mutex_);

    if (fault_) {
      if (fault_->audit) throw util::AuditWriteError("audit log unavailable: " + fault_->message);
      throw std::runtime_error("job store unavailable: " + fault_->message);
    }
    if (!started_) {
      throw util::InvalidStateError("delivery workers are not running");
    }

    const auto now = util::Now();

    std::lock_guard pending_lock(pending_->mutex);

    std::vector<const model::SubmissionJob*> eligible;
    for (auto& [id, job] : jobs_) {
      if (job.status != SUBMISSION_STATUS_QUEUED) continue;

      if (!job.deadline_warned && job.deadline - now <= options_.deadline_warning_window) {
        auto warned            = job;
        warned.deadline_warned = true;
        warned.updated_at      = now;
        Persist(warned, false);
        job = std::move(warned);

        auto payload = JobPayload(job);
        (*payload.mutable_fields())["seconds_remaining"] =
            NumberValue(static_cast<double>(std::chrono::duration_cast<std::chrono::seconds>(job.deadline - now).count()));
        notifications.emplace_back(notify::events::kDeadlineWarning, std::move(payload));
      }

      if (in_flight_.contains(id) || pending_->job_ids.contains(id)) continue;
      if (job.scheduled_time && *job.scheduled_time > now) continue;
      if (job.attempts > job.max_retries) continue;

      eligible.push_back(&job);
    }

    std::sort(eligible.begin(), eligible.end(), [](const auto* a, const auto* b) { return QueueOrder(*a, *b); });

    size_t busy = in_flight_.size();
    for (const auto& id : pending_->job_ids) {
      if (!in_flight_.contains(id)) ++busy;
    }
    const size_t capacity = busy >= options_.max_concurrent_submissions ? 0 : options_.max_concurrent_submissions - busy;

    for (const auto* job : eligible) {
      if (admitted.size() >= capacity) break;

      if (job->deadline < now) {
        Audit(job->job_id, events::kDeadlinePassed, false,
              MakeStruct({{"deadline", StringValue(util::FormatTime(job->deadline))}, {"admitted_at", StringValue(util::FormatTime(now))}}),
              "admitted after deadline");
        BIDSUB_LOG_WARN("admitting job past its deadline", {observability::StringField("job_id", job->job_id)});
      }

      in_flight_.insert(job->job_id);
      admitted.push_back(job->job_id);
    }
  }

  for (const auto& job_id : admitted) {
    scheduler_->Enqueue(job_id);
  }

  DispatchNotifications(std::move(notifications));
  return admitted;
}

// ------------------------------------------------------------------
// Delivery
// ------------------------------------------------------------------

void SubmissionOrchestrator::ExecuteAttempt(const std::string& job_id) {
  model::SubmissionJob job;
  {
    std::shared_lock lock(mutex_);
    auto             it = jobs_.find(job_id);
    if (it == jobs_.end() || !in_flight_.contains(job_id)) {
      throw util::InvalidStateError("job " + job_id + " was not admitted");
    }
    job = it->second;
  }

  try {
    auto entry = portals_->Find(job.portal);
    if (!entry) {
      RecordAssemblyFailure(job_id, "assembly", {"portal not registered: " + job.portal});
      return;
    }

    model::BidDocumentPackage package;
    std::vector<std::string>  violations;
    std::string               stage = "assembly";
    try {
      package                = assembler_->Assemble(job.bid_document, entry->requirements);
      package.submission_key = job.job_id;
      stage                  = "validation";
      violations             = assembler_->Validate(package, entry->requirements);
    } catch (const std::exception& e) {
      violations.push_back(e.what());
    }

    if (!violations.empty()) {
      RecordAssemblyFailure(job_id, stage, violations);
      return;
    }

    {
      std::unique_lock lock(mutex_);
      auto             next = jobs_.at(job_id);
      const auto       now  = util::Now();

      Transition(next, SUBMISSION_STATUS_SUBMITTED);
      ++next.attempts;
      if (!next.submitted_at) next.submitted_at = now;
      next.updated_at = now;

      Audit(job_id, events::kAttemptStarted, true,
            MakeStruct({{"attempt", NumberValue(next.attempts)},
                        {"portal", StringValue(next.portal)},
                        {"format", StringValue(config::DocumentFormatName(package.primary_document.format))},
                        {"size_bytes", NumberValue(static_cast<double>(package.primary_document.size_bytes))}}));
      Persist(next, false);
      jobs_[job_id] = std::move(next);
    }

    BIDSUB_LOG_INFO("delivery started", {observability::StringField("job_id", job_id), observability::StringField("portal", job.portal)});

    auto outcome = DeliverWithTimeout(entry->adapter, std::move(package), entry->requirements.delivery_timeout, job_id, pending_);
    RecordOutcome(job_id, outcome);
  } catch (const util::AuditWriteError& e) {
    LatchFault(job_id, true, e.what());
  } catch (const std::exception& e) {
    LatchFault(job_id, false, e.what());
  }
}

void SubmissionOrchestrator::RecordAssemblyFailure(const std::string& job_id, const std::string& stage,
                                                   const std::vector<std::string>& violations) {
  std::vector<Notification> notifications;
  {
    std::unique_lock lock(mutex_);
    auto             job = jobs_.at(job_id);

    ++job.assembly_failures;
    job.last_error = stage + " failed: " + Join(violations, "; ");
    job.updated_at = util::Now();

    Audit(job_id, events::kAttemptFailed, false,
          MakeStruct({{"stage", StringValue(stage)},
                      {"violations", ListValue(violations)},
                      {"assembly_failures", NumberValue(job.assembly_failures)}}),
          job.last_error);

    if (job.assembly_failures <= job.max_retries) {
      Audit(job_id, events::kRetryScheduled, true,
            MakeStruct({{"stage", StringValue(stage)}, {"assembly_failures", NumberValue(job.assembly_failures)}}));
      Transition(job, SUBMISSION_STATUS_QUEUED);
    } else {
      Audit(job_id, events::kAbandoned, false,
            MakeStruct({{"stage", StringValue(stage)}, {"assembly_failures", NumberValue(job.assembly_failures)}}), job.last_error);
      Transition(job, SUBMISSION_STATUS_FAILED);
      notifications.emplace_back(notify::events::kSubmissionFailed, JobPayload(job));
    }

    Persist(job, false);
    FinishLocked(std::move(job));
  }

  BIDSUB_LOG_WARN("package rejected before delivery",
                  {observability::StringField("job_id", job_id), observability::StringField("stage", stage),
                   observability::IntField("violations", static_cast<int64_t>(violations.size()))});

  DispatchNotifications(std::move(notifications));
}

void SubmissionOrchestrator::RecordOutcome(const std::string& job_id, const model::DeliveryOutcome& outcome) {
  std::vector<Notification> notifications;
  {
    std::unique_lock lock(mutex_);
    auto             job = jobs_.at(job_id);
    const auto       now = util::Now();
    job.updated_at       = now;

    if (outcome.success) {
      Transition(job, SUBMISSION_STATUS_CONFIRMED);
      if (!job.confirmation_number) job.confirmation_number = outcome.confirmation_number.value_or("");
      if (!job.confirmed_at) job.confirmed_at = now;
      job.last_error.clear();

      Audit(job_id, events::kAttemptSucceeded, true,
            MakeStruct({{"attempt", NumberValue(job.attempts)}, {"confirmation_number", StringValue(*job.confirmation_number)}}));
      notifications.emplace_back(notify::events::kSubmissionSuccessful, JobPayload(job));
    } else {
      const bool retryable = outcome.error_class != ERROR_CLASS_NON_RETRYABLE;
      job.last_error       = outcome.error_message.value_or("delivery failed");

      Audit(job_id, events::kAttemptFailed, false,
            MakeStruct({{"attempt", NumberValue(job.attempts)},
                        {"stage", StringValue("delivery")},
                        {"error_class", StringValue(retryable ? "retryable" : "non_retryable")}}),
            job.last_error);

      if (retryable && job.attempts <= job.max_retries) {
        Audit(job_id, events::kRetryScheduled, true,
              MakeStruct({{"attempt", NumberValue(job.attempts)},
                          {"remaining", NumberValue(job.max_retries + 1 - job.attempts)}}));
        Transition(job, SUBMISSION_STATUS_QUEUED);
      } else {
        if (retryable) {
          Audit(job_id, events::kAbandoned, false,
                MakeStruct({{"attempts", NumberValue(job.attempts)}, {"reason", StringValue("retries exhausted")}}), job.last_error);
        }
        Transition(job, SUBMISSION_STATUS_FAILED);
        notifications.emplace_back(notify::events::kSubmissionFailed, JobPayload(job));
      }
    }

    Persist(job, false);

    BIDSUB_LOG_INFO("delivery finished", {observability::StringField("job_id", job_id),
                                          observability::StringField("status", model::StatusName(job.status)),
                                          observability::IntField("attempts", job.attempts)});
    FinishLocked(std::move(job));
  }

  DispatchNotifications(std::move(notifications));
}

void SubmissionOrchestrator::FinishLocked(model::SubmissionJob job) {
  const auto job_id = job.job_id;
  jobs_[job_id]     = std::move(job);
  in_flight_.erase(job_id);
  idle_cv_.notify_all();
}

void SubmissionOrchestrator::LatchFault(const std::string& job_id, bool audit, const std::string& message) {
  {
    std::unique_lock lock(mutex_);
    if (!fault_) fault_ = Fault{audit, message};
  }

  BIDSUB_LOG_ERROR(audit ? "audit write failed; queue halted" : "job store write failed; queue halted",
                   {observability::StringField("job_id", job_id), observability::StringField("error", message)});
}

// ------------------------------------------------------------------
// Operator retry
// ------------------------------------------------------------------

model::SubmissionJob SubmissionOrchestrator::RetrySubmission(const std::string& job_id) {
  model::SubmissionJob job;
  {
    std::unique_lock lock(mutex_);

    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
      throw util::NotFoundError("job not found: " + job_id);
    }

    job = it->second;
    if (job.status != SUBMISSION_STATUS_FAILED) {
      throw util::InvalidStateError("job " + job_id + " is " + model::StatusName(job.status) + ", only failed jobs can be retried");
    }
    if (job.attempts >= job.max_retries) {
      throw util::RetryExhaustedError("job " + job_id + " used " + std::to_string(job.attempts) + " of " +
                                      std::to_string(job.max_retries) + " retries");
    }

    Audit(job_id, events::kSubmissionRetry, true,
          MakeStruct({{"attempts", NumberValue(job.attempts)}, {"max_retries", NumberValue(job.max_retries)}}));

    Transition(job, SUBMISSION_STATUS_QUEUED);
    job.assembly_failures = 0;
    job.last_error.clear();
    job.updated_at = util::Now();

    Persist(job, false);
    it->second = job;
  }

  BIDSUB_LOG_INFO("job requeued by operator", {observability::StringField("job_id", job_id)});
  return job;
}

// ------------------------------------------------------------------
// Queries
// ------------------------------------------------------------------

JobStatus SubmissionOrchestrator::GetJobStatus(const std::string& job_id) const {
  std::shared_lock lock(mutex_);
  auto             it = jobs_.find(job_id);
  if (it == jobs_.end()) {
    throw util::NotFoundError("job not found: " + job_id);
  }
  return ToStatus(it->second, in_flight_.contains(job_id));
}

SubmissionStatistics SubmissionOrchestrator::GetStatistics() const {
  std::shared_lock lock(mutex_);

  SubmissionStatistics stats;
  for (const auto& [_, job] : jobs_) {
    switch (job.status) {
      case SUBMISSION_STATUS_QUEUED:
        stats.set_queued(stats.queued() + 1);
        break;
      case SUBMISSION_STATUS_SUBMITTED:
        stats.set_submitted(stats.submitted() + 1);
        break;
      case SUBMISSION_STATUS_CONFIRMED:
        stats.set_confirmed(stats.confirmed() + 1);
        break;
      case SUBMISSION_STATUS_FAILED:
        stats.set_failed(stats.failed() + 1);
        break;
      default:
        break;
    }
  }

  stats.set_total(stats.queued() + stats.submitted() + stats.confirmed() + stats.failed());
  stats.set_success_rate(stats.total() == 0 ? 0.0 : static_cast<double>(stats.confirmed()) / static_cast<double>(stats.total()));
  return stats;
}

std::vector<JobStatus> SubmissionOrchestrator::ListQueue(std::optional<SubmissionStatus> status) const {
  std::shared_lock lock(mutex_);

  std::vector<const model::SubmissionJob*> selected;
  for (const auto& [_, job] : jobs_) {
    if (!status || job.status == *status) selected.push_back(&job);
  }
  std::sort(selected.begin(), selected.end(), [](const auto* a, const auto* b) { return QueueOrder(*a, *b); });

  std::vector<JobStatus> out;
  out.reserve(selected.size());
  for (const auto* job : selected) {
    out.push_back(ToStatus(*job, in_flight_.contains(job->job_id)));
  }
  return out;
}

std::vector<audit::AuditLogEntry> SubmissionOrchestrator::AuditTrail(const std::string& job_id) const {
  {
    std::shared_lock lock(mutex_);
    if (!jobs_.contains(job_id)) {
      throw util::NotFoundError("job not found: " + job_id);
    }
  }
  return audit_->Entries(job_id);
}

bool SubmissionOrchestrator::WaitForIdle(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  {
    std::unique_lock lock(mutex_);
    if (!idle_cv_.wait_until(lock, deadline, [&] { return in_flight_.empty(); })) return false;
  }

  std::unique_lock lock(pending_->mutex);
  return pending_->released.wait_until(lock, deadline, [&] { return pending_->job_ids.empty(); });
}

size_t SubmissionOrchestrator::InFlightCount() const {
  std::shared_lock lock(mutex_);
  return in_flight_.size();
}

// ------------------------------------------------------------------
// Helpers
// ------------------------------------------------------------------

void SubmissionOrchestrator::Persist(const model::SubmissionJob& job, bool insert) {
  auto record = ToRecord(job);
  auto tx     = repository_->Begin();

  auto result = insert ? repository_->InsertJob(*tx, record) : repository_->UpdateJob(*tx, record);
  if (!result) {
    tx->Rollback();
    ThrowIfDbError(result, std::string(insert ? "insert" : "update") + " job " + job.job_id);
  }

  tx->Commit();
}

void SubmissionOrchestrator::Audit(const std::string& job_id, const char* event_type, bool success, Struct details,
                                   std::optional<std::string> error_message) {
  audit::AuditLogEntry entry;
  entry.job_id        = job_id;
  entry.event_type    = event_type;
  entry.success       = success;
  entry.details       = std::move(details);
  entry.error_message = std::move(error_message);
  entry.timestamp     = util::Now();

  try {
    audit_->Append(entry);
  } catch (const util::AuditWriteError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::AuditWriteError(std::string(event_type) + " for job " + job_id + ": " + e.what());
  }
}

void SubmissionOrchestrator::DispatchNotifications(std::vector<Notification> notifications) {
  for (const auto& [event_type, payload] : notifications) {
    try {
      notifications_->Notify(event_type, payload);
    } catch (const std::exception& e) {
      BIDSUB_LOG_WARN("notification failed", {observability::StringField("event", event_type), observability::StringField("error", e.what())});
    }
  }
}

} // namespace bidsub::core
