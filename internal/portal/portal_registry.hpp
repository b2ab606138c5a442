#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/portal_requirements.hpp"
#include "internal/portal/portal_adapter.hpp"

namespace bidsub::portal {

struct PortalEntry {
  std::shared_ptr<PortalAdapter> adapter;
  model::PortalRequirements      requirements;
};

/*
  Portal name -> adapter and requirements profile.

  Populated once at startup and read-only afterwards; lookups need no lock.
*/
class PortalRegistry {
 public:
  // Throws std::invalid_argument on a duplicate or empty name, or null adapter.
  void Register(std::shared_ptr<PortalAdapter> adapter, model::PortalRequirements requirements);

  std::optional<PortalEntry> Find(const std::string& portal) const;

  bool Contains(const std::string& portal) const {
    return entries_.contains(portal);
  }

  std::vector<std::string> Names() const;

 private:
  std::map<std::string, PortalEntry> entries_;
};

} // namespace bidsub::portal
