#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/notify/async_notification_sink.hpp"
#include "internal/notify/fanout_notification_sink.hpp"
#include "internal/notify/log_notification_sink.hpp"

namespace {

class RecordingSink final : public bidsub::notify::NotificationSink {
 public:
  void Notify(const std::string& event_type, const google::protobuf::Struct& payload) override {
    std::lock_guard lock(mutex_);
    events_.push_back(event_type + ":" + payload.fields().at("job_id").string_value());
  }

  std::vector<std::string> Events() {
    std::lock_guard lock(mutex_);
    return events_;
  }

 private:
  std::mutex               mutex_;
  std::vector<std::string> events_;
};

class ThrowingSink final : public bidsub::notify::NotificationSink {
 public:
  void Notify(const std::string&, const google::protobuf::Struct&) override {
    throw std::runtime_error("smtp relay refused connection");
  }
};

google::protobuf::Struct Payload(const std::string& job_id) {
  google::protobuf::Struct payload;
  (*payload.mutable_fields())["job_id"].set_string_value(job_id);
  return payload;
}

void TestAsyncPreservesOrder() {
  auto recorder = std::make_shared<RecordingSink>();
  bidsub::notify::AsyncNotificationSink sink(recorder);

  for (int i = 0; i < 50; ++i) {
    sink.Notify(bidsub::notify::events::kQueued, Payload("job-" + std::to_string(i)));
  }
  sink.Flush();

  auto events = recorder->Events();
  assert(events.size() == 50);
  for (int i = 0; i < 50; ++i) {
    assert(events[i] == "queued:job-" + std::to_string(i));
  }
}

void TestAsyncSurvivesInnerFailure() {
  bidsub::notify::AsyncNotificationSink failing(std::make_shared<ThrowingSink>());
  failing.Notify(bidsub::notify::events::kSubmissionFailed, Payload("job-1"));
  failing.Flush();

  // The dispatcher must still be alive after a throwing delivery.
  failing.Notify(bidsub::notify::events::kSubmissionFailed, Payload("job-2"));
  failing.Flush();
  failing.Stop();
}

void TestStopDrainsThenDrops() {
  auto recorder = std::make_shared<RecordingSink>();
  auto sink     = std::make_unique<bidsub::notify::AsyncNotificationSink>(recorder);

  sink->Notify(bidsub::notify::events::kQueued, Payload("a"));
  sink->Notify(bidsub::notify::events::kDeadlineWarning, Payload("b"));
  sink->Stop();

  auto events = recorder->Events();
  assert(events.size() == 2);
  assert(events[1] == "deadline_warning:b");

  sink->Notify(bidsub::notify::events::kQueued, Payload("late"));
  sink->Flush();
  assert(recorder->Events().size() == 2);

  // Stop is idempotent; the destructor calls it again.
  sink->Stop();
  sink.reset();
}

void TestFanoutIsolatesFailures() {
  auto first  = std::make_shared<RecordingSink>();
  auto second = std::make_shared<RecordingSink>();

  bidsub::notify::FanoutNotificationSink fanout({first, std::make_shared<ThrowingSink>(), second,
                                                 std::make_shared<bidsub::notify::LogNotificationSink>()});

  fanout.Notify(bidsub::notify::events::kSubmissionSuccessful, Payload("job-9"));

  assert(first->Events().size() == 1);
  assert(second->Events().size() == 1);
  assert(second->Events()[0] == "submission_successful:job-9");
}

} // namespace

int main() {
  TestAsyncPreservesOrder();
  TestAsyncSurvivesInnerFailure();
  TestStopDrainsThenDrops();
  TestFanoutIsolatesFailures();

  std::cout << "bidsub_unit_notification_sinks: pass\n";
  return 0;
}
