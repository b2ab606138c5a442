#pragma once

#include <optional>
#include <string>

#include "bidsub/v1/types.pb.h"

namespace bidsub::model {

struct DeliveryOutcome {
  bool                       success = false;
  std::optional<std::string> confirmation_number;
  bidsub::v1::ErrorClass     error_class = bidsub::v1::ERROR_CLASS_NONE;
  std::optional<std::string> error_message;

  static DeliveryOutcome Confirmed(std::string confirmation) {
    DeliveryOutcome outcome;
    outcome.success             = true;
    outcome.confirmation_number = std::move(confirmation);
    return outcome;
  }

  static DeliveryOutcome Retryable(std::string message) {
    DeliveryOutcome outcome;
    outcome.error_class   = bidsub::v1::ERROR_CLASS_RETRYABLE;
    outcome.error_message = std::move(message);
    return outcome;
  }

  static DeliveryOutcome NonRetryable(std::string message) {
    DeliveryOutcome outcome;
    outcome.error_class   = bidsub::v1::ERROR_CLASS_NON_RETRYABLE;
    outcome.error_message = std::move(message);
    return outcome;
  }
};

} // namespace bidsub::model
