#include "state_machine.hpp"

namespace bidsub::model {

const char* StatusName(SubmissionStatus status) {
  switch (status) {
    case bidsub::v1::SUBMISSION_STATUS_QUEUED:
      return "queued";
    case bidsub::v1::SUBMISSION_STATUS_SUBMITTED:
      return "submitted";
    case bidsub::v1::SUBMISSION_STATUS_CONFIRMED:
      return "confirmed";
    case bidsub::v1::SUBMISSION_STATUS_FAILED:
      return "failed";
    default:
      return "unspecified";
  }
}

} // namespace bidsub::model
