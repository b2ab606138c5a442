#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"
#include "tests/support/bid_fixtures.hpp"
#include "tests/support/orchestrator_harness.hpp"

namespace {

using bidsub::core::OrchestratorOptions;
using bidsub::core::SubmitOptions;
using bidsub::model::DeliveryOutcome;
using bidsub::testing::OrchestratorHarness;
using bidsub::testing::SampleBid;
using namespace bidsub::v1;
using namespace std::chrono_literals;

constexpr auto kTenDays = std::chrono::hours(24 * 10);

OrchestratorOptions Options(uint32_t capacity, uint32_t max_retries = 3) {
  OrchestratorOptions options;
  options.max_concurrent_submissions = capacity;
  options.default_max_retries        = max_retries;
  return options;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestAdmissionOrderFollowsPriorityThenDeadline() {
  OrchestratorHarness h(Options(1));
  h.AddRfp("rfp-near", kTenDays);
  h.AddRfp("rfp-far", kTenDays * 2);

  auto a = h.orchestrator->Submit("rfp-near", SampleBid(), "mock", 1);
  auto b = h.orchestrator->Submit("rfp-far", SampleBid(), "mock", 1);
  auto c = h.orchestrator->Submit("rfp-far", SampleBid(), "mock", 5);

  auto queue = h.orchestrator->ListQueue(SUBMISSION_STATUS_QUEUED);
  assert(queue.size() == 3);
  assert(queue[0].job_id() == c.job_id);
  assert(queue[1].job_id() == a.job_id);
  assert(queue[2].job_id() == b.job_id);

  h.orchestrator->Start();
  h.RunUntilSettled();

  const std::vector<std::string> expected{c.job_id, a.job_id, b.job_id};
  assert(h.mock->DeliveredKeys() == expected);
  assert(h.mock->MaxConcurrentDeliveries() == 1);
}

void TestRetryableFailuresRequeueUntilSuccess() {
  OrchestratorHarness h(Options(1, 2));
  h.AddRfp("rfp-1", kTenDays);
  h.mock->Script(DeliveryOutcome::Retryable("portal busy"), 2);

  auto job = h.orchestrator->Submit("rfp-1", SampleBid(), "mock", 0);
  assert(job.max_retries == 2);

  h.orchestrator->Start();
  h.RunUntilSettled();

  auto status = h.orchestrator->GetJobStatus(job.job_id);
  assert(status.status() == SUBMISSION_STATUS_CONFIRMED);
  assert(status.attempts() == 3);
  assert(status.confirmation_number() == "MOCK-000001");
  assert(status.has_submitted_at() && status.has_confirmed_at());
  assert(status.last_error().empty());

  auto events = h.EventTypes(job.job_id);
  assert(std::count(events.begin(), events.end(), "attempt_started") == 3);
  assert(std::count(events.begin(), events.end(), "retry_scheduled") == 2);
  assert(events.front() == "created");
  assert(events.back() == "attempt_succeeded");

  auto trail = h.orchestrator->AuditTrail(job.job_id);
  for (size_t i = 1; i < trail.size(); ++i) {
    assert(trail[i].sequence > trail[i - 1].sequence);
  }

  assert(h.notifications->Count("queued") == 1);
  assert(h.notifications->Count("submission_successful") == 1);
}

void TestNonRetryableFailureFailsImmediately() {
  OrchestratorHarness h(Options(1, 1));
  h.AddRfp("rfp-1", kTenDays);
  h.mock->Script(DeliveryOutcome::NonRetryable("solicitation closed"));

  auto job = h.orchestrator->Submit("rfp-1", SampleBid(), "mock", 0);
  h.orchestrator->Start();
  h.RunUntilSettled();

  auto status = h.orchestrator->GetJobStatus(job.job_id);
  assert(status.status() == SUBMISSION_STATUS_FAILED);
  assert(status.attempts() == 1);
  assert(status.last_error() == "solicitation closed");

  const std::vector<std::string> expected{"created", "attempt_started", "attempt_failed"};
  assert(h.EventTypes(job.job_id) == expected);
  assert(h.notifications->Count("submission_failed") == 1);

  assert(Throws<bidsub::util::RetryExhaustedError>([&] { h.orchestrator->RetrySubmission(job.job_id); }));
  assert(h.orchestrator->GetJobStatus(job.job_id).status() == SUBMISSION_STATUS_FAILED);
}

void TestOperatorRetryRequeuesFailedJob() {
  OrchestratorHarness h(Options(1, 3));
  h.AddRfp("rfp-1", kTenDays);
  h.mock->Script(DeliveryOutcome::NonRetryable("missing signature"));

  auto job = h.orchestrator->Submit("rfp-1", SampleBid(), "mock", 0);
  h.orchestrator->Start();
  h.RunUntilSettled();
  assert(h.orchestrator->GetJobStatus(job.job_id).status() == SUBMISSION_STATUS_FAILED);

  auto requeued = h.orchestrator->RetrySubmission(job.job_id);
  assert(requeued.status == SUBMISSION_STATUS_QUEUED);
  assert(requeued.attempts == 1);
  assert(requeued.last_error.empty());

  h.RunUntilSettled();
  auto status = h.orchestrator->GetJobStatus(job.job_id);
  assert(status.status() == SUBMISSION_STATUS_CONFIRMED);
  assert(status.attempts() == 2);

  auto events = h.EventTypes(job.job_id);
  assert(std::find(events.begin(), events.end(), "submission_retry") != events.end());
}

void TestRetryableExhaustionIsAbandoned() {
  OrchestratorHarness h(Options(1, 1));
  h.AddRfp("rfp-1", kTenDays);
  h.mock->SetDefaultOutcome(DeliveryOutcome::Retryable("503 service unavailable"));

  auto job = h.orchestrator->Submit("rfp-1", SampleBid(), "mock", 0);
  h.orchestrator->Start();
  h.RunUntilSettled();

  auto status = h.orchestrator->GetJobStatus(job.job_id);
  assert(status.status() == SUBMISSION_STATUS_FAILED);
  assert(status.attempts() == 2);
  assert(h.mock->DeliveryCount(job.job_id) == 2);

  auto trail = h.orchestrator->AuditTrail(job.job_id);
  assert(trail.back().event_type == "abandoned");
  assert(!trail.back().success);
  assert(trail.back().details.fields().at("reason").string_value() == "retries exhausted");
}

void TestDeliveryTimeoutIsRetryable() {
  auto req             = bidsub::testing::MockRequirements();
  req.delivery_timeout = 50ms;

  OrchestratorHarness h(Options(1), req);
  h.AddRfp("rfp-1", kTenDays);
  h.mock->SetLatency(400ms);

  SubmitOptions submit;
  submit.max_retries = 0;
  auto job           = h.orchestrator->Submit("rfp-1", SampleBid(), "mock", 0, submit);

  h.orchestrator->Start();
  h.RunUntilSettled();

  auto status = h.orchestrator->GetJobStatus(job.job_id);
  assert(status.status() == SUBMISSION_STATUS_FAILED);
  assert(status.attempts() == 1);
  assert(status.last_error().find("timed out") != std::string::npos);

  auto trail = h.orchestrator->AuditTrail(job.job_id);
  assert(trail.back().event_type == "abandoned");

  // WaitForIdle also covers the portal call that outlived its timeout
  assert(h.mock->DeliveryCount(job.job_id) == 1);
  assert(h.mock->MaxConcurrentDeliveries() == 1);
}

void TestTimedOutCallHoldsJobAndSlotUntilItReturns() {
  auto req             = bidsub::testing::MockRequirements();
  req.delivery_timeout = 50ms;

  OrchestratorHarness h(Options(1, 2), req);
  h.AddRfp("rfp-1", kTenDays);
  h.mock->SetLatency(300ms);

  auto urgent = h.orchestrator->Submit("rfp-1", SampleBid(), "mock", 5);
  auto other  = h.orchestrator->Submit("rfp-1", SampleBid(), "mock", 0);

  h.orchestrator->Start();
  auto admitted = h.orchestrator->ProcessQueue();
  assert(admitted.size() == 1);
  assert(admitted[0] == urgent.job_id);

  // the attempt has given up waiting, but the portal call is still running
  std::this_thread::sleep_for(120ms);
  assert(h.orchestrator->ProcessQueue().empty());
  assert(h.mock->DeliveryCount() == 1);

  auto terminal = [&](const std::string& id) {
    auto status = h.orchestrator->GetJobStatus(id).status();
    return status == SUBMISSION_STATUS_FAILED || status == SUBMISSION_STATUS_CONFIRMED;
  };
  for (int i = 0; i < 1000 && !(terminal(urgent.job_id) && terminal(other.job_id)); ++i) {
    h.orchestrator->ProcessQueue();
    std::this_thread::sleep_for(10ms);
  }
  assert(h.orchestrator->WaitForIdle(10s));

  assert(!h.mock->OverlapDetected());
  assert(h.mock->MaxConcurrentDeliveries() == 1);

  for (const auto& id : {urgent.job_id, other.job_id}) {
    auto status = h.orchestrator->GetJobStatus(id);
    assert(status.status() == SUBMISSION_STATUS_FAILED);
    assert(status.attempts() == 3);
    assert(h.mock->DeliveryCount(id) == 3);
  }
}

void TestAssemblyFailureDoesNotConsumeAttempts() {
  auto req            = bidsub::testing::MockRequirements();
  req.required_fields = {"contract_value"};

  OrchestratorHarness h(Options(1, 1), req);
  h.AddRfp("rfp-1", kTenDays);

  auto job = h.orchestrator->Submit("rfp-1", SampleBid(), "mock", 0);
  h.orchestrator->Start();
  h.RunUntilSettled();

  auto status = h.orchestrator->GetJobStatus(job.job_id);
  assert(status.status() == SUBMISSION_STATUS_FAILED);
  assert(status.attempts() == 0);
  assert(status.assembly_failures() == 2);
  assert(status.last_error() == "validation failed: missing required field: contract_value");
  assert(h.mock->DeliveryCount() == 0);

  auto requeued = h.orchestrator->RetrySubmission(job.job_id);
  assert(requeued.assembly_failures == 0);
  assert(requeued.status == SUBMISSION_STATUS_QUEUED);
}

void TestLateJobIsAdmittedWithDeadlineAudit() {
  OrchestratorHarness h(Options(1));
  h.AddRfp("rfp-soon", 300ms);

  auto job = h.orchestrator->Submit("rfp-soon", SampleBid(), "mock", 0);
  std::this_thread::sleep_for(400ms);

  h.orchestrator->Start();
  h.RunUntilSettled();

  assert(h.orchestrator->GetJobStatus(job.job_id).status() == SUBMISSION_STATUS_CONFIRMED);

  auto trail = h.orchestrator->AuditTrail(job.job_id);
  auto late  = std::find_if(trail.begin(), trail.end(), [](const auto& e) { return e.event_type == "deadline_passed"; });
  assert(late != trail.end());
  assert(!late->success);
  assert(late->error_message == std::optional<std::string>("admitted after deadline"));

  // the deadline sits inside the default warning window
  assert(h.notifications->Count("deadline_warning") == 1);
}

void TestDeadlineWarningIsSentOnce() {
  OrchestratorHarness h(Options(1));
  h.AddRfp("rfp-1", std::chrono::hours(2));
  h.AddRfp("rfp-2", kTenDays);

  SubmitOptions later;
  later.scheduled_time = bidsub::util::Now() + std::chrono::hours(1);
  h.orchestrator->Submit("rfp-1", SampleBid(), "mock", 0, later);
  h.orchestrator->Submit("rfp-2", SampleBid(), "mock", 0, later);

  h.orchestrator->Start();
  assert(h.orchestrator->ProcessQueue().empty());
  assert(h.orchestrator->ProcessQueue().empty());

  assert(h.notifications->Count("deadline_warning") == 1);
}

void TestAuditFailureOnSubmitCreatesNoJob() {
  OrchestratorHarness h(Options(1));
  h.AddRfp("rfp-1", kTenDays);
  h.repository->fail_audit = true;

  assert(Throws<bidsub::util::AuditWriteError>([&] { h.orchestrator->Submit("rfp-1", SampleBid(), "mock", 0); }));
  assert(h.orchestrator->ListQueue().empty());
  assert(h.orchestrator->GetStatistics().total() == 0);
  assert(h.notifications->Events().empty());
}

void TestAuditFailureInWorkerHaltsQueue() {
  OrchestratorHarness h(Options(1));
  h.AddRfp("rfp-1", kTenDays);

  auto job = h.orchestrator->Submit("rfp-1", SampleBid(), "mock", 0);
  h.repository->fail_audit = true;

  h.orchestrator->Start();
  assert(h.orchestrator->ProcessQueue().size() == 1);

  bool halted = false;
  for (int i = 0; i < 200 && !halted; ++i) {
    halted = Throws<bidsub::util::AuditWriteError>([&] { h.orchestrator->ProcessQueue(); });
    if (!halted) std::this_thread::sleep_for(10ms);
  }
  assert(halted);

  // nothing was delivered and the job was never published as submitted
  assert(h.mock->DeliveryCount() == 0);
  assert(h.orchestrator->GetJobStatus(job.job_id).status() == SUBMISSION_STATUS_QUEUED);
}

void TestJobStoreFailureInWorkerHaltsQueue() {
  OrchestratorHarness h(Options(1));
  h.AddRfp("rfp-1", kTenDays);

  auto job = h.orchestrator->Submit("rfp-1", SampleBid(), "mock", 0);
  h.repository->fail_jobs = true;

  h.orchestrator->Start();
  assert(h.orchestrator->ProcessQueue().size() == 1);

  std::string error;
  for (int i = 0; i < 200 && error.empty(); ++i) {
    try {
      h.orchestrator->ProcessQueue();
      std::this_thread::sleep_for(10ms);
    } catch (const std::runtime_error& e) {
      error = e.what();
    }
  }
  assert(error.find("job store unavailable") != std::string::npos);
  assert(error.find("disk full") != std::string::npos);
  assert(h.mock->DeliveryCount() == 0);
  assert(h.orchestrator->GetJobStatus(job.job_id).status() == SUBMISSION_STATUS_QUEUED);
}

void TestNotificationFailureDoesNotChangeOutcome() {
  OrchestratorHarness h(Options(1));
  h.AddRfp("rfp-1", kTenDays);
  h.notifications->fail = true;

  auto job = h.orchestrator->Submit("rfp-1", SampleBid(), "mock", 0);
  h.orchestrator->Start();
  h.RunUntilSettled();

  assert(h.orchestrator->GetJobStatus(job.job_id).status() == SUBMISSION_STATUS_CONFIRMED);
  assert(h.notifications->Count("queued") == 1);
  assert(h.notifications->Count("submission_successful") == 1);
}

void TestStatisticsPartitionJobs() {
  OrchestratorHarness h(Options(2, 1));
  h.AddRfp("rfp-1", kTenDays);

  auto stats = h.orchestrator->GetStatistics();
  assert(stats.total() == 0);
  assert(stats.success_rate() == 0.0);

  h.mock->Script(DeliveryOutcome::NonRetryable("rejected"));
  h.orchestrator->Submit("rfp-1", SampleBid(), "mock", 10);
  h.orchestrator->Submit("rfp-1", SampleBid(), "mock", 0);
  h.orchestrator->Submit("rfp-1", SampleBid(), "mock", 0);

  SubmitOptions later;
  later.scheduled_time = bidsub::util::Now() + std::chrono::hours(1);
  h.orchestrator->Submit("rfp-1", SampleBid(), "mock", 0, later);

  h.orchestrator->Start();
  h.RunUntilSettled();

  stats = h.orchestrator->GetStatistics();
  assert(stats.total() == 4);
  assert(stats.queued() + stats.submitted() + stats.confirmed() + stats.failed() == stats.total());
  assert(stats.queued() == 1);
  assert(stats.confirmed() == 2);
  assert(stats.failed() == 1);
  assert(stats.success_rate() == 0.5);
}

void TestInputErrorsLeaveNoTrace() {
  OrchestratorHarness h(Options(1));
  h.AddRfp("rfp-open", kTenDays);
  h.AddRfp("rfp-closed", -std::chrono::hours(1));

  assert(Throws<bidsub::util::InvalidReferenceError>([&] { h.orchestrator->Submit("rfp-missing", SampleBid(), "mock", 0); }));
  assert(Throws<bidsub::util::InvalidReferenceError>([&] { h.orchestrator->Submit("rfp-open", SampleBid(), "fedconnect", 0); }));
  assert(Throws<bidsub::util::PastDeadlineError>([&] { h.orchestrator->Submit("rfp-closed", SampleBid(), "mock", 0); }));
  assert(h.orchestrator->GetStatistics().total() == 0);

  assert(Throws<bidsub::util::NotFoundError>([&] { h.orchestrator->GetJobStatus("job-404"); }));
  assert(Throws<bidsub::util::NotFoundError>([&] { h.orchestrator->RetrySubmission("job-404"); }));
  assert(Throws<bidsub::util::NotFoundError>([&] { h.orchestrator->AuditTrail("job-404"); }));

  auto job = h.orchestrator->Submit("rfp-open", SampleBid(), "mock", 0);
  assert(Throws<bidsub::util::InvalidStateError>([&] { h.orchestrator->RetrySubmission(job.job_id); }));
  assert(Throws<bidsub::util::InvalidStateError>([&] { h.orchestrator->ProcessQueue(); }));

  assert(h.EventTypes(job.job_id) == std::vector<std::string>{"created"});
  assert(job.bid_document.solicitation_number() == "W912DY-26-R-0042");
}

} // namespace

int main() {
  TestAdmissionOrderFollowsPriorityThenDeadline();
  TestRetryableFailuresRequeueUntilSuccess();
  TestNonRetryableFailureFailsImmediately();
  TestOperatorRetryRequeuesFailedJob();
  TestRetryableExhaustionIsAbandoned();
  TestDeliveryTimeoutIsRetryable();
  TestTimedOutCallHoldsJobAndSlotUntilItReturns();
  TestAssemblyFailureDoesNotConsumeAttempts();
  TestLateJobIsAdmittedWithDeadlineAudit();
  TestDeadlineWarningIsSentOnce();
  TestAuditFailureOnSubmitCreatesNoJob();
  TestAuditFailureInWorkerHaltsQueue();
  TestJobStoreFailureInWorkerHaltsQueue();
  TestNotificationFailureDoesNotChangeOutcome();
  TestStatisticsPartitionJobs();
  TestInputErrorsLeaveNoTrace();

  std::cout << "bidsub_unit_submission_orchestrator: pass\n";
  return 0;
}
