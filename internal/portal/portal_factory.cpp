#include "portal_factory.hpp"

#include <cstdlib>
#include <stdexcept>

#include "internal/config/portal_profiles.hpp"
#include "internal/observability/logging.hpp"
#include "internal/portal/gsa_ebuy/gsa_ebuy_adapter.hpp"
#include "internal/portal/mock/mock_portal_adapter.hpp"
#include "internal/portal/sam_gov/sam_gov_adapter.hpp"
#include "internal/portal/transport/spool_transport.hpp"
#include "internal/util/time.hpp"

namespace bidsub::portal {

namespace {

using bidsub::runtime::config::PortalConfig;

std::string Credential(const PortalConfig& cfg) {
  const auto& env = cfg.transport().credential_env();
  if (env.empty()) return {};
  if (const char* value = std::getenv(env.c_str())) return value;

  BIDSUB_LOG_WARN("portal credential variable not set",
                  {observability::StringField("portal", cfg.name()), observability::StringField("env", env)});
  return {};
}

std::shared_ptr<transport::PortalTransport> MakeTransport(const PortalConfig& cfg, const std::string& prefix) {
  if (cfg.transport().spool_directory().empty()) {
    throw std::invalid_argument("portal " + cfg.name() + ": transport.spool_directory is required");
  }
  return std::make_shared<transport::SpoolTransport>(cfg.transport().spool_directory(), prefix);
}

std::shared_ptr<PortalAdapter> MakeAdapter(const PortalConfig& cfg, const model::PortalRequirements& req) {
  const auto& kind = cfg.adapter();

  if (kind == "mock") {
    mock::MockPortalAdapter::Options options;
    options.name = cfg.name();
    if (cfg.mock().has_latency()) {
      options.latency = util::FromProto(cfg.mock().latency());
    } else if (req.average_latency.count() > 0) {
      options.latency = req.average_latency;
    }
    return std::make_shared<mock::MockPortalAdapter>(options);
  }

  if (kind == "sam_gov") {
    sam_gov::SamGovAdapter::Options options;
    options.name    = cfg.name();
    options.api_key = Credential(cfg);
    options.timeout = req.delivery_timeout;
    if (!cfg.transport().endpoint().empty()) options.endpoint = cfg.transport().endpoint();
    return std::make_shared<sam_gov::SamGovAdapter>(options, MakeTransport(cfg, "SAM"));
  }

  if (kind == "gsa_ebuy") {
    gsa_ebuy::GsaEbuyAdapter::Options options;
    options.name       = cfg.name();
    options.credential = Credential(cfg);
    options.timeout    = req.delivery_timeout;
    if (!cfg.transport().endpoint().empty()) options.endpoint = cfg.transport().endpoint();
    return std::make_shared<gsa_ebuy::GsaEbuyAdapter>(options, MakeTransport(cfg, "EBUY"));
  }

  throw std::invalid_argument("portal " + cfg.name() + ": unknown adapter '" + kind + "'");
}

} // namespace

std::shared_ptr<PortalRegistry> BuildPortalRegistry(const bidsub::runtime::config::RuntimeConfig& config) {
  auto registry = std::make_shared<PortalRegistry>();

  for (const auto& cfg : config.portals()) {
    auto requirements = config::ToRequirements(cfg, config.orchestrator());
    auto adapter      = MakeAdapter(cfg, requirements);
    registry->Register(std::move(adapter), std::move(requirements));

    BIDSUB_LOG_INFO("portal registered",
                    {observability::StringField("portal", cfg.name()), observability::StringField("adapter", cfg.adapter())});
  }

  return registry;
}

} // namespace bidsub::portal
