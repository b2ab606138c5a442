#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/portal/portal_registry.hpp"

namespace bidsub::portal {

/*
  Builds adapters and requirement profiles for every configured portal.

  Throws std::invalid_argument for an unknown adapter kind or incomplete
  transport settings.
*/
std::shared_ptr<PortalRegistry> BuildPortalRegistry(const bidsub::runtime::config::RuntimeConfig& config);

} // namespace bidsub::portal
