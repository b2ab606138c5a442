#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "bidsub/v1/bid.pb.h"
#include "bidsub/v1/types.pb.h"
#include "internal/util/time.hpp"

namespace bidsub::model {

/*
  One attempt-to-deliver-a-bid.

  Owned and mutated only by the orchestrator. submitted_at and confirmed_at
  are set on first occurrence and never overwritten.
*/
struct SubmissionJob {
  std::string job_id;

  std::string rfp_id;
  std::string portal;
  bidsub::v1::BidDocument bid_document;

  util::TimePoint                deadline{};
  int32_t                        priority = 0;
  std::optional<util::TimePoint> scheduled_time;

  bidsub::v1::SubmissionStatus status = bidsub::v1::SUBMISSION_STATUS_QUEUED;

  // Delivery calls made to a portal adapter.
  uint32_t attempts    = 0;
  uint32_t max_retries = 0;

  // Attempts that failed before reaching the portal.
  uint32_t assembly_failures = 0;

  std::optional<std::string>     confirmation_number;
  std::optional<util::TimePoint> submitted_at;
  std::optional<util::TimePoint> confirmed_at;
  std::string                    last_error;

  util::TimePoint created_at{};
  util::TimePoint updated_at{};
  bool            deadline_warned = false;
};

} // namespace bidsub::model
