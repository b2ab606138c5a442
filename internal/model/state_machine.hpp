#pragma once

#include "bidsub/v1/types.pb.h"

namespace bidsub::model {

using bidsub::v1::SubmissionStatus;

/*
  Submission job state machine.

    QUEUED    -> SUBMITTED  (package assembled, delivery started)
    QUEUED    -> FAILED     (assembly failures exhausted)
    SUBMITTED -> CONFIRMED  (portal accepted)
    SUBMITTED -> QUEUED     (retryable failure, retries remain)
    SUBMITTED -> FAILED     (non-retryable, or retries exhausted)
    FAILED    -> QUEUED     (operator retry only)

  CONFIRMED is terminal.
*/

constexpr bool IsTerminal(SubmissionStatus status) {
  return status == bidsub::v1::SUBMISSION_STATUS_CONFIRMED || status == bidsub::v1::SUBMISSION_STATUS_FAILED;
}

constexpr bool CanTransition(SubmissionStatus from, SubmissionStatus to) {
  using namespace bidsub::v1;

  if (from == to) {
    return from == SUBMISSION_STATUS_QUEUED;
  }

  switch (from) {
    case SUBMISSION_STATUS_QUEUED:
      return to == SUBMISSION_STATUS_SUBMITTED || to == SUBMISSION_STATUS_FAILED;
    case SUBMISSION_STATUS_SUBMITTED:
      return to == SUBMISSION_STATUS_CONFIRMED || to == SUBMISSION_STATUS_QUEUED || to == SUBMISSION_STATUS_FAILED;
    case SUBMISSION_STATUS_FAILED:
      return to == SUBMISSION_STATUS_QUEUED;
    default:
      return false;
  }
}

const char* StatusName(SubmissionStatus status);

} // namespace bidsub::model
