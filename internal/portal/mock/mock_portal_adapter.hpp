#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/portal/portal_adapter.hpp"

namespace bidsub::portal::mock {

/*
  Deterministic in-process portal.

  Outcomes are consumed from a script in order; once the script is empty
  the default outcome applies. A key that has already been confirmed is
  answered with its original confirmation without consuming the script.

  Every call sleeps for the configured latency and is recorded. Two
  overlapping calls for the same submission key set OverlapDetected().
*/
class MockPortalAdapter final : public PortalAdapter {
 public:
  struct Options {
    std::string               name = "mock";
    std::chrono::milliseconds latency{5};
    std::string               confirmation_prefix = "MOCK";
  };

  MockPortalAdapter();
  explicit MockPortalAdapter(Options options);

  std::string Name() const override {
    return options_.name;
  }

  model::DeliveryOutcome Submit(const model::BidDocumentPackage& package) override;

  // A confirmed outcome with no confirmation number gets a generated one.
  void Script(model::DeliveryOutcome outcome, uint32_t times = 1);
  void ScriptThrow(std::string message);
  void SetDefaultOutcome(model::DeliveryOutcome outcome);
  void SetLatency(std::chrono::milliseconds latency);

  uint64_t                 DeliveryCount() const;
  uint64_t                 DeliveryCount(const std::string& submission_key) const;
  std::vector<std::string> DeliveredKeys() const;
  bool                     OverlapDetected() const;
  uint32_t                 MaxConcurrentDeliveries() const;

 private:
  struct Step {
    std::optional<model::DeliveryOutcome> outcome;
    std::string                           throw_message;
  };

  Step NextStep();
  std::string NextConfirmation();

  Options options_;

  mutable std::mutex mutex_;

  std::deque<Step>       script_;
  model::DeliveryOutcome default_outcome_ = model::DeliveryOutcome::Confirmed("");

  std::unordered_map<std::string, std::string> confirmed_;
  std::unordered_map<std::string, uint32_t>    in_flight_;
  std::vector<std::string>                     delivered_;

  uint64_t confirmation_seq_ = 0;
  uint32_t concurrent_       = 0;
  uint32_t max_concurrent_   = 0;
  bool     overlap_          = false;
};

} // namespace bidsub::portal::mock
