#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/audit/repository_audit_log.hpp"
#include "internal/rfp/repository_rfp_lookup.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/failing_repository.hpp"

namespace {

using bidsub::audit::AuditLogEntry;
using bidsub::audit::RepositoryAuditLog;
using bidsub::rfp::RepositoryRfpLookup;
using bidsub::rfp::RfpInfo;
using bidsub::testing::FailingRepository;
using namespace std::chrono_literals;

AuditLogEntry Entry(const std::string& job_id, const char* event_type) {
  AuditLogEntry entry;
  entry.job_id     = job_id;
  entry.event_type = event_type;
  entry.timestamp  = bidsub::util::Now();
  return entry;
}

void TestAppendAssignsSequenceAndRoundTripsDetails() {
  auto               repo = std::make_shared<FailingRepository>();
  RepositoryAuditLog log(repo);

  auto created = Entry("job-1", bidsub::audit::events::kCreated);
  (*created.details.mutable_fields())["portal"].set_string_value("sam_gov");
  (*created.details.mutable_fields())["priority"].set_number_value(7);
  log.Append(created);
  assert(created.sequence == 1);

  auto failed    = Entry("job-1", bidsub::audit::events::kAttemptFailed);
  failed.success = false;
  failed.error_message = "portal busy";
  log.Append(failed);
  assert(failed.sequence == 2);

  auto entries = log.Entries("job-1");
  assert(entries.size() == 2);
  assert(entries[0].event_type == "created");
  assert(entries[0].details.fields().at("portal").string_value() == "sam_gov");
  assert(entries[0].details.fields().at("priority").number_value() == 7);
  assert(!entries[0].error_message.has_value());
  assert(!entries[1].success);
  assert(entries[1].error_message == std::optional<std::string>("portal busy"));

  assert(log.Entries("job-2").empty());
}

void TestAppendFailureIsAuditWriteError() {
  auto               repo = std::make_shared<FailingRepository>();
  RepositoryAuditLog log(repo);

  repo->fail_audit = true;
  auto entry       = Entry("job-1", bidsub::audit::events::kCreated);

  bool threw = false;
  try {
    log.Append(entry);
  } catch (const bidsub::util::AuditWriteError& e) {
    threw = std::string(e.what()).find("audit volume offline") != std::string::npos;
  }
  assert(threw);
  assert(entry.sequence == 0);

  repo->fail_audit = false;
  assert(log.Entries("job-1").empty());
}

void TestRfpUpsertAndFind() {
  auto                repo = std::make_shared<FailingRepository>();
  RepositoryRfpLookup rfps(repo);

  assert(!rfps.Find("rfp-1").has_value());

  RfpInfo info;
  info.rfp_id              = "rfp-1";
  info.solicitation_number = "SOL-1";
  info.title               = "Routers";
  info.response_deadline   = bidsub::util::FromUnixMillis(bidsub::util::ToUnixMillis(bidsub::util::Now() + 1h));
  rfps.Upsert(info);

  auto found = rfps.Find("rfp-1");
  assert(found.has_value());
  assert(found->solicitation_number == "SOL-1");
  assert(found->response_deadline == info.response_deadline);

  bool threw = false;
  try {
    rfps.Upsert(RfpInfo{});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestAppendAssignsSequenceAndRoundTripsDetails();
  TestAppendFailureIsAuditWriteError();
  TestRfpUpsertAndFind();

  std::cout << "bidsub_unit_repository_adapters: pass\n";
  return 0;
}
