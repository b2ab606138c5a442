#pragma once

#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace bidsub::rfp {

struct RfpInfo {
  std::string rfp_id;
  std::string solicitation_number;
  std::string title;
  std::string agency;

  util::TimePoint response_deadline{};
};

// Resolves an RFP reference to its deadline and identifying fields.
class RfpLookup {
 public:
  virtual ~RfpLookup() = default;

  virtual std::optional<RfpInfo> Find(const std::string& rfp_id) = 0;
};

} // namespace bidsub::rfp
