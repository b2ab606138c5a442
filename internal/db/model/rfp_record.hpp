#pragma once

#include <cstdint>
#include <string>

namespace bidsub::db::model {

struct RfpRecord {
  std::string rfp_id;
  std::string solicitation_number;
  std::string title;
  std::string agency;

  uint64_t response_deadline_ms = 0;
};

}
