#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "bidsub/v1/types.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

#if BIDSUB_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using bidsub::db::ErrorCode;
using bidsub::db::Repository;
using bidsub::db::memory::MemoryRepository;
using bidsub::db::model::AuditRecord;
using bidsub::db::model::JobRecord;
using bidsub::db::model::RfpRecord;
using bidsub::v1::SUBMISSION_STATUS_CONFIRMED;
using bidsub::v1::SUBMISSION_STATUS_QUEUED;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

JobRecord MakeJob(const std::string& id, uint64_t created_at_ms) {
  JobRecord job;
  job.job_id        = id;
  job.rfp_id        = "rfp-" + id;
  job.portal        = "mock";
  job.bid_document  = std::string("\x0a\x03" "doc\x00\x01", 7);
  job.status        = SUBMISSION_STATUS_QUEUED;
  job.priority      = 5;
  job.deadline_ms   = created_at_ms + 3'600'000;
  job.max_retries   = 3;
  job.created_at_ms = created_at_ms;
  job.updated_at_ms = created_at_ms;
  return job;
}

void VerifyJobLifecycle(Repository& repo, const std::string& id) {
  auto tx  = repo.Begin();
  auto job = MakeJob(id, NowMs());
  assert(repo.InsertJob(*tx, job));

  auto duplicate = repo.InsertJob(*tx, job);
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists);

  auto read = repo.GetJob(*tx, id);
  assert(read.has_value());
  assert(read->bid_document == job.bid_document);
  assert(read->status == SUBMISSION_STATUS_QUEUED);
  assert(read->scheduled_time_ms == 0);
  assert(read->confirmation_number.empty());
  assert(!read->deadline_warned);

  read->status              = SUBMISSION_STATUS_CONFIRMED;
  read->attempts            = 2;
  read->assembly_failures   = 1;
  read->confirmation_number = "SAM-0001";
  read->submitted_at_ms     = job.created_at_ms + 10;
  read->confirmed_at_ms     = job.created_at_ms + 20;
  read->last_error          = "";
  read->deadline_warned     = true;
  assert(repo.UpdateJob(*tx, *read));

  auto updated = repo.GetJob(*tx, id);
  assert(updated.has_value());
  assert(updated->status == SUBMISSION_STATUS_CONFIRMED);
  assert(updated->attempts == 2);
  assert(updated->assembly_failures == 1);
  assert(updated->confirmation_number == "SAM-0001");
  assert(updated->confirmed_at_ms == job.created_at_ms + 20);
  assert(updated->deadline_warned);

  auto missing = MakeJob(id + "-missing", NowMs());
  auto result  = repo.UpdateJob(*tx, missing);
  assert(!result);
  assert(result.code == ErrorCode::NotFound);

  tx->Commit();
}

void VerifyListOrdering(Repository& repo, const std::string& prefix) {
  const auto base = NowMs();
  {
    auto tx = repo.Begin();
    assert(repo.InsertJob(*tx, MakeJob(prefix + "-b", base + 1)));
    assert(repo.InsertJob(*tx, MakeJob(prefix + "-a", base + 1)));
    assert(repo.InsertJob(*tx, MakeJob(prefix + "-c", base)));
    tx->Commit();
  }

  auto tx   = repo.Begin();
  auto jobs = repo.ListJobs(*tx);
  tx->Commit();

  std::vector<std::string> ours;
  for (const auto& job : jobs) {
    if (job.job_id.rfind(prefix, 0) == 0) ours.push_back(job.job_id);
  }
  assert(ours.size() == 3);
  assert(ours[0] == prefix + "-c");
  assert(ours[1] == prefix + "-a");
  assert(ours[2] == prefix + "-b");
}

void VerifyAuditSequencing(Repository& repo, const std::string& job_id) {
  for (int i = 0; i < 3; ++i) {
    auto        tx = repo.Begin();
    AuditRecord record;
    record.job_id       = job_id;
    record.event_type   = i == 0 ? "created" : "attempt_failed";
    record.success      = i == 0;
    record.details_json = R"({"attempt":)" + std::to_string(i) + "}";
    record.has_error    = i != 0;
    record.error_message = i != 0 ? "portal busy" : "";
    record.timestamp_ms = NowMs();
    assert(repo.AppendAudit(*tx, record));
    assert(record.sequence == static_cast<uint64_t>(i + 1));
    tx->Commit();
  }

  auto tx      = repo.Begin();
  auto entries = repo.ListAudit(*tx, job_id);
  tx->Commit();

  assert(entries.size() == 3);
  assert(entries[0].event_type == "created");
  assert(!entries[0].has_error);
  assert(entries[2].has_error);
  assert(entries[2].error_message == "portal busy");
  assert(entries[1].details_json == R"({"attempt":1})");
  for (size_t i = 1; i < entries.size(); ++i) {
    assert(entries[i].sequence > entries[i - 1].sequence);
  }

  auto other_tx = repo.Begin();
  assert(repo.ListAudit(*other_tx, job_id + "-other").empty());
  other_tx->Commit();
}

void VerifyRfpUpsert(Repository& repo, const std::string& rfp_id) {
  auto      tx = repo.Begin();
  RfpRecord rfp;
  rfp.rfp_id               = rfp_id;
  rfp.solicitation_number  = "SOL-1";
  rfp.title                = "Routers";
  rfp.agency               = "GSA";
  rfp.response_deadline_ms = NowMs() + 1000;
  assert(repo.UpsertRfp(*tx, rfp));

  rfp.title = "Routers and switches";
  assert(repo.UpsertRfp(*tx, rfp));

  auto read = repo.GetRfp(*tx, rfp_id);
  assert(read.has_value());
  assert(read->title == "Routers and switches");
  assert(read->response_deadline_ms == rfp.response_deadline_ms);
  assert(!repo.GetRfp(*tx, rfp_id + "-missing").has_value());
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertJob(*tx, MakeJob(id, NowMs())));
    tx->Rollback();
  }
  {
    // destructor without commit discards as well
    auto tx = repo.Begin();
    assert(repo.InsertJob(*tx, MakeJob(id, NowMs())));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetJob(*check_tx, id).has_value());
  check_tx->Commit();
}

void VerifyConcurrentAppends(Repository& repo, const std::string& job_id) {
  constexpr int kThreads = 4;
  constexpr int kPerThread = 10;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&repo, &job_id] {
      for (int i = 0; i < kPerThread; ++i) {
        while (true) {
          try {
            auto        tx = repo.Begin();
            AuditRecord record;
            record.job_id       = job_id;
            record.event_type   = "attempt_started";
            record.details_json = "{}";
            record.timestamp_ms = NowMs();
            if (!repo.AppendAudit(*tx, record)) continue;
            tx->Commit();
            break;
          } catch (const std::runtime_error&) {
            // optimistic conflict on the memory backend; retry
          }
        }
      }
    });
  }
  for (auto& thread : threads) thread.join();

  auto tx      = repo.Begin();
  auto entries = repo.ListAudit(*tx, job_id);
  tx->Commit();

  assert(entries.size() == kThreads * kPerThread);
  for (size_t i = 0; i < entries.size(); ++i) {
    assert(entries[i].sequence == i + 1);
  }
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertJob(*tx, MakeJob(id, NowMs())));
    AuditRecord record;
    record.job_id       = id;
    record.event_type   = "created";
    record.details_json = "{}";
    record.timestamp_ms = NowMs();
    assert(repo->AppendAudit(*tx, record));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx  = repo->Begin();
  auto job = repo->GetJob(*tx, id);
  assert(job.has_value());
  assert(job->max_retries == 3);
  assert(repo->ListAudit(*tx, id).size() == 1);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if BIDSUB_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  const auto db_path = std::filesystem::temp_directory_path() / "bidsub_repository_parity.sqlite";
  std::filesystem::remove(db_path);

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<bidsub::db::sqlite::SqliteDB>(db_path.string());
    db->EnsureSchema();
    return std::make_shared<bidsub::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path.string() + "-wal");
            std::filesystem::remove(db_path.string() + "-shm");
          },
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();

    VerifyJobLifecycle(*repo, backend.name + "-job-life");
    VerifyListOrdering(*repo, backend.name + "-order");
    VerifyAuditSequencing(*repo, backend.name + "-audit");
    VerifyRfpUpsert(*repo, backend.name + "-rfp");
    VerifyRollbackBehavior(*repo, backend.name + "-rollback");
    VerifyConcurrentAppends(*repo, backend.name + "-concurrent");
  }

  VerifyRestartDurability(backend, backend.name + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if BIDSUB_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "bidsub_integration_repository_parity: pass\n";
  return 0;
}
