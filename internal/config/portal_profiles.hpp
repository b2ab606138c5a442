#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "bidsub/v1/types.pb.h"
#include "config/config.pb.h"
#include "internal/model/portal_requirements.hpp"

namespace bidsub::config {

// "html", "wordml", "pdf", "json" (case-insensitive).
std::optional<bidsub::v1::DocumentFormat> ParseDocumentFormat(std::string_view name);

const char* DocumentFormatName(bidsub::v1::DocumentFormat format);

/*
  Builds the immutable requirements profile for one configured portal.

  Throws std::invalid_argument for an empty name or unknown format.
*/
model::PortalRequirements ToRequirements(const bidsub::runtime::config::PortalConfig& portal,
                                         const bidsub::runtime::config::OrchestratorConfig& orchestrator);

} // namespace bidsub::config
