#include "mock_portal_adapter.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <thread>

#include "internal/observability/logging.hpp"

namespace bidsub::portal::mock {

MockPortalAdapter::MockPortalAdapter() : MockPortalAdapter(Options{}) {
}

MockPortalAdapter::MockPortalAdapter(Options options) : options_(std::move(options)) {
}

void MockPortalAdapter::Script(model::DeliveryOutcome outcome, uint32_t times) {
  std::lock_guard lock(mutex_);
  for (uint32_t i = 0; i < times; ++i) {
    script_.push_back(Step{outcome, {}});
  }
}

void MockPortalAdapter::ScriptThrow(std::string message) {
  std::lock_guard lock(mutex_);
  script_.push_back(Step{std::nullopt, std::move(message)});
}

void MockPortalAdapter::SetDefaultOutcome(model::DeliveryOutcome outcome) {
  std::lock_guard lock(mutex_);
  default_outcome_ = std::move(outcome);
}

void MockPortalAdapter::SetLatency(std::chrono::milliseconds latency) {
  std::lock_guard lock(mutex_);
  options_.latency = latency;
}

MockPortalAdapter::Step MockPortalAdapter::NextStep() {
  if (script_.empty()) {
    return Step{default_outcome_, {}};
  }
  auto step = std::move(script_.front());
  script_.pop_front();
  return step;
}

std::string MockPortalAdapter::NextConfirmation() {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%06llu", static_cast<unsigned long long>(++confirmation_seq_));
  return options_.confirmation_prefix + "-" + buf;
}

model::DeliveryOutcome MockPortalAdapter::Submit(const model::BidDocumentPackage& package) {
  const auto& key = package.submission_key;

  std::chrono::milliseconds latency;
  {
    std::lock_guard lock(mutex_);
    if (in_flight_[key]++ > 0) {
      overlap_ = true;
    }
    ++concurrent_;
    max_concurrent_ = std::max(max_concurrent_, concurrent_);
    delivered_.push_back(key);
    latency = options_.latency;
  }

  if (latency.count() > 0) {
    std::this_thread::sleep_for(latency);
  }

  std::lock_guard lock(mutex_);
  if (--in_flight_[key] == 0) {
    in_flight_.erase(key);
  }
  --concurrent_;

  if (auto it = confirmed_.find(key); it != confirmed_.end()) {
    BIDSUB_LOG_INFO("mock portal: duplicate submission", {observability::StringField("submission_key", key)});
    return model::DeliveryOutcome::Confirmed(it->second);
  }

  auto step = NextStep();
  if (!step.outcome) {
    throw std::runtime_error(step.throw_message);
  }

  auto outcome = std::move(*step.outcome);
  if (outcome.success) {
    if (!outcome.confirmation_number || outcome.confirmation_number->empty()) {
      outcome.confirmation_number = NextConfirmation();
    }
    confirmed_[key] = *outcome.confirmation_number;
  }
  return outcome;
}

uint64_t MockPortalAdapter::DeliveryCount() const {
  std::lock_guard lock(mutex_);
  return delivered_.size();
}

uint64_t MockPortalAdapter::DeliveryCount(const std::string& submission_key) const {
  std::lock_guard lock(mutex_);
  return static_cast<uint64_t>(std::count(delivered_.begin(), delivered_.end(), submission_key));
}

std::vector<std::string> MockPortalAdapter::DeliveredKeys() const {
  std::lock_guard lock(mutex_);
  return delivered_;
}

bool MockPortalAdapter::OverlapDetected() const {
  std::lock_guard lock(mutex_);
  return overlap_;
}

uint32_t MockPortalAdapter::MaxConcurrentDeliveries() const {
  std::lock_guard lock(mutex_);
  return max_concurrent_;
}

} // namespace bidsub::portal::mock
