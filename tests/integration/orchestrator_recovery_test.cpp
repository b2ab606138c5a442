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
using bidsub::testing::OrchestratorHarness;
using bidsub::testing::SampleBid;
using namespace bidsub::v1;
using namespace std::chrono_literals;

constexpr auto kTenDays = std::chrono::hours(24 * 10);

// Leaves the stored job as a crash mid-delivery would: SUBMITTED, one attempt.
void MarkSubmittedInStore(OrchestratorHarness& h, const std::string& job_id) {
  auto tx     = h.repository->Begin();
  auto record = h.repository->GetJob(*tx, job_id);
  assert(record);

  record->status          = SUBMISSION_STATUS_SUBMITTED;
  record->attempts        = 1;
  record->submitted_at_ms = bidsub::util::ToUnixMillis(bidsub::util::Now());
  auto result = h.repository->UpdateJob(*tx, *record);
  assert(result);
  tx->Commit();
}

void TestHydrateRecoversInterruptedDelivery() {
  OrchestratorOptions options;
  options.max_concurrent_submissions = 2;

  OrchestratorHarness h(options);
  h.AddRfp("rfp-1", kTenDays);

  auto interrupted = h.orchestrator->Submit("rfp-1", SampleBid(), "mock", 0);
  auto waiting     = h.orchestrator->Submit("rfp-1", SampleBid(), "mock", 3);
  MarkSubmittedInStore(h, interrupted.job_id);

  // The portal accepted the first delivery before the crash.
  bidsub::model::BidDocumentPackage accepted;
  accepted.submission_key = interrupted.job_id;
  accepted.portal         = "mock";
  auto first              = h.mock->Submit(accepted);
  assert(first.success);

  h.orchestrator = h.NewOrchestrator();
  h.orchestrator->Hydrate();

  auto recovered = h.orchestrator->GetJobStatus(interrupted.job_id);
  assert(recovered.status() == SUBMISSION_STATUS_QUEUED);
  assert(recovered.attempts() == 1);
  assert(h.orchestrator->GetJobStatus(waiting.job_id).priority() == 3);

  auto events = h.EventTypes(interrupted.job_id);
  assert(events.back() == "recovered");

  h.orchestrator->Start();
  h.RunUntilSettled();

  auto confirmed = h.orchestrator->GetJobStatus(interrupted.job_id);
  assert(confirmed.status() == SUBMISSION_STATUS_CONFIRMED);
  assert(confirmed.attempts() == 2);
  assert(confirmed.confirmation_number() == *first.confirmation_number);
  assert(h.mock->DeliveryCount(interrupted.job_id) == 2);

  assert(h.orchestrator->GetJobStatus(waiting.job_id).status() == SUBMISSION_STATUS_CONFIRMED);
  assert(h.orchestrator->GetStatistics().confirmed() == 2);
}

void TestHydrateAbandonsJobInterruptedOnFinalAttempt() {
  OrchestratorHarness h;
  h.AddRfp("rfp-1", kTenDays);

  SubmitOptions no_retries;
  no_retries.max_retries = 0;
  auto last_chance       = h.orchestrator->Submit("rfp-1", SampleBid(), "mock", 0, no_retries);

  SubmitOptions one_retry;
  one_retry.max_retries = 1;
  auto has_budget       = h.orchestrator->Submit("rfp-1", SampleBid(), "mock", 0, one_retry);

  MarkSubmittedInStore(h, last_chance.job_id);
  MarkSubmittedInStore(h, has_budget.job_id);

  h.orchestrator = h.NewOrchestrator();
  h.orchestrator->Hydrate();

  auto failed = h.orchestrator->GetJobStatus(last_chance.job_id);
  assert(failed.status() == SUBMISSION_STATUS_FAILED);
  assert(failed.attempts() == 1);
  assert(failed.last_error().find("interrupted") != std::string::npos);

  auto events = h.EventTypes(last_chance.job_id);
  assert(events.size() >= 2);
  assert(events[events.size() - 2] == "recovered");
  assert(events.back() == "abandoned");
  assert(h.notifications->Count("submission_failed") == 1);

  // the failure is durable
  {
    auto tx     = h.repository->Begin();
    auto record = h.repository->GetJob(*tx, last_chance.job_id);
    tx->Commit();
    assert(record);
    assert(record->status == SUBMISSION_STATUS_FAILED);
  }

  assert(h.orchestrator->GetJobStatus(has_budget.job_id).status() == SUBMISSION_STATUS_QUEUED);

  h.orchestrator->Start();
  h.RunUntilSettled();

  assert(h.mock->DeliveryCount(last_chance.job_id) == 0);
  assert(h.orchestrator->GetJobStatus(last_chance.job_id).status() == SUBMISSION_STATUS_FAILED);
  assert(h.orchestrator->GetJobStatus(has_budget.job_id).status() == SUBMISSION_STATUS_CONFIRMED);

  bool exhausted = false;
  try {
    h.orchestrator->RetrySubmission(last_chance.job_id);
  } catch (const bidsub::util::RetryExhaustedError&) {
    exhausted = true;
  }
  assert(exhausted);
}

void TestHydratedStateMatchesStore() {
  OrchestratorHarness h;
  h.AddRfp("rfp-1", kTenDays);

  h.mock->Script(bidsub::model::DeliveryOutcome::NonRetryable("rejected"));
  auto failed = h.orchestrator->Submit("rfp-1", SampleBid(), "mock", 0);
  h.orchestrator->Start();
  h.RunUntilSettled();
  h.orchestrator->Stop();

  auto before = h.orchestrator->GetJobStatus(failed.job_id);
  auto trail  = h.orchestrator->AuditTrail(failed.job_id).size();

  h.orchestrator = h.NewOrchestrator();
  h.orchestrator->Hydrate();

  auto after = h.orchestrator->GetJobStatus(failed.job_id);
  assert(after.status() == SUBMISSION_STATUS_FAILED);
  assert(after.attempts() == before.attempts());
  assert(after.last_error() == "rejected");
  assert(after.deadline().seconds() == before.deadline().seconds());
  assert(h.orchestrator->AuditTrail(failed.job_id).size() == trail);

  // retry still works across the restart
  assert(h.orchestrator->RetrySubmission(failed.job_id).status == SUBMISSION_STATUS_QUEUED);
}

void TestConcurrentProcessingNeverOverlapsAJob() {
  OrchestratorOptions options;
  options.max_concurrent_submissions = 4;
  options.default_max_retries        = 10;

  OrchestratorHarness h(options);
  h.AddRfp("rfp-1", kTenDays);
  h.mock->SetLatency(20ms);

  // the first six deliveries are throttled
  h.mock->Script(bidsub::model::DeliveryOutcome::Retryable("throttled"), 6);

  std::vector<std::string> ids;
  for (int i = 0; i < 12; ++i) {
    ids.push_back(h.orchestrator->Submit("rfp-1", SampleBid(), "mock", i % 3).job_id);
  }

  h.orchestrator->Start();

  std::vector<std::thread> tickers;
  for (int t = 0; t < 4; ++t) {
    tickers.emplace_back([&] {
      for (int i = 0; i < 200; ++i) {
        h.orchestrator->ProcessQueue();
        assert(h.orchestrator->InFlightCount() <= 4);
        if (h.orchestrator->GetStatistics().confirmed() == ids.size()) break;
        std::this_thread::sleep_for(5ms);
      }
    });
  }
  for (auto& t : tickers) t.join();
  assert(h.orchestrator->WaitForIdle(10s));

  assert(!h.mock->OverlapDetected());
  assert(h.mock->MaxConcurrentDeliveries() <= 4);
  assert(h.mock->DeliveryCount() == ids.size() + 6);

  for (const auto& id : ids) {
    auto status = h.orchestrator->GetJobStatus(id);
    assert(status.status() == SUBMISSION_STATUS_CONFIRMED);
    assert(!status.in_flight());
  }
}

} // namespace

int main() {
  TestHydrateRecoversInterruptedDelivery();
  TestHydrateAbandonsJobInterruptedOnFinalAttempt();
  TestHydratedStateMatchesStore();
  TestConcurrentProcessingNeverOverlapsAJob();

  std::cout << "bidsub_integration_orchestrator_recovery: pass\n";
  return 0;
}
