#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "bidsub/v1/types.pb.h"

namespace bidsub::model {

/*
  Static per-portal profile loaded from configuration.
*/
struct PortalRequirements {
  std::string portal;

  bidsub::v1::DocumentFormat required_format = bidsub::v1::DOCUMENT_FORMAT_PDF;

  std::vector<std::string> required_forms;
  std::vector<std::string> required_certifications;

  // Bid fields (solicitation_number, cage_code, ...) that must be non-empty.
  std::vector<std::string> required_fields;

  uint64_t max_package_bytes = 100ull * 1024 * 1024;

  std::chrono::milliseconds average_latency{0};
  std::chrono::milliseconds delivery_timeout{30000};

  std::optional<uint32_t> max_retries;
};

} // namespace bidsub::model
