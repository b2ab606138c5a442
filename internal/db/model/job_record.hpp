#pragma once

#include <cstdint>
#include <string>

namespace bidsub::db::model {

/*
  Persistent submission job row.

  Timestamps are unix milliseconds; 0 means unset.
  bid_document holds the serialized bidsub.v1.BidDocument.
*/

struct JobRecord {
  std::string job_id;
  std::string rfp_id;
  std::string portal;
  std::string bid_document;

  int32_t  status   = 0;
  int32_t  priority = 0;
  uint64_t deadline_ms       = 0;
  uint64_t scheduled_time_ms = 0;

  uint32_t attempts          = 0;
  uint32_t max_retries       = 0;
  uint32_t assembly_failures = 0;

  std::string confirmation_number;
  uint64_t    submitted_at_ms = 0;
  uint64_t    confirmed_at_ms = 0;
  std::string last_error;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
  bool     deadline_warned = false;
};

}
