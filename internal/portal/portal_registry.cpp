#include "portal_registry.hpp"

#include <stdexcept>

namespace bidsub::portal {

void PortalRegistry::Register(std::shared_ptr<PortalAdapter> adapter, model::PortalRequirements requirements) {
  if (!adapter) {
    throw std::invalid_argument("portal adapter must not be null");
  }
  if (requirements.portal.empty()) {
    throw std::invalid_argument("portal name must not be empty");
  }

  auto name = requirements.portal;
  if (entries_.contains(name)) {
    throw std::invalid_argument("portal already registered: " + name);
  }
  entries_.emplace(std::move(name), PortalEntry{std::move(adapter), std::move(requirements)});
}

std::optional<PortalEntry> PortalRegistry::Find(const std::string& portal) const {
  auto it = entries_.find(portal);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::string> PortalRegistry::Names() const {
  std::vector<std::string> names;
  names.reserve(entries_.size());
  for (const auto& [name, _] : entries_) names.push_back(name);
  return names;
}

} // namespace bidsub::portal
