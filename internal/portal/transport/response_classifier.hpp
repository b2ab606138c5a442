#pragma once

#include <string>

#include "internal/model/delivery_outcome.hpp"
#include "portal_transport.hpp"

namespace bidsub::portal::transport {

/*
  Maps a portal HTTP response to a delivery outcome.

    2xx                   success (confirmation_number read from the JSON body)
    408, 425, 429, 5xx    retryable
    other                 non-retryable

  A 2xx body without a confirmation number is retryable; the submission
  key makes the resubmission safe.
*/
model::DeliveryOutcome ClassifyResponse(const std::string& portal, const TransportResponse& response);

bool IsRetryableStatus(int status_code);

} // namespace bidsub::portal::transport
