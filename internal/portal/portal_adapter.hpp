#pragma once

#include <string>

#include "internal/model/bid_package.hpp"
#include "internal/model/delivery_outcome.hpp"

namespace bidsub::portal {

/*
  Delivers a validated package to one government portal.

  Submit may block on network I/O. Implementations classify failures as
  retryable or non-retryable; an exception escaping Submit is treated as
  retryable by the caller. Implementations must tolerate a resubmission of
  the same package.submission_key.
*/
class PortalAdapter {
 public:
  virtual ~PortalAdapter() = default;

  virtual std::string Name() const = 0;

  virtual model::DeliveryOutcome Submit(const model::BidDocumentPackage& package) = 0;
};

} // namespace bidsub::portal
