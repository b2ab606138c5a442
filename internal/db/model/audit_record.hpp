#pragma once

#include <cstdint>
#include <string>

namespace bidsub::db::model {

/*
  Append-only audit row. Key: (job_id, sequence).

  details_json is a JSON object (google.protobuf.Struct encoding).
*/

struct AuditRecord {
  std::string job_id;
  uint64_t    sequence = 0;

  std::string event_type;
  bool        success = true;
  std::string details_json;

  bool        has_error = false;
  std::string error_message;

  uint64_t timestamp_ms = 0;
};

}
