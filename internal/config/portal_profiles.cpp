#include "portal_profiles.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "internal/util/time.hpp"

namespace bidsub::config {

namespace {

constexpr std::chrono::milliseconds kDefaultDeliveryTimeout{30000};

std::string Lower(std::string_view in) {
  std::string out(in);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

std::optional<bidsub::v1::DocumentFormat> ParseDocumentFormat(std::string_view name) {
  const auto lowered = Lower(name);
  if (lowered == "html") return bidsub::v1::DOCUMENT_FORMAT_HTML;
  if (lowered == "wordml" || lowered == "docx") return bidsub::v1::DOCUMENT_FORMAT_WORDML;
  if (lowered == "pdf") return bidsub::v1::DOCUMENT_FORMAT_PDF;
  if (lowered == "json") return bidsub::v1::DOCUMENT_FORMAT_JSON;
  return std::nullopt;
}

const char* DocumentFormatName(bidsub::v1::DocumentFormat format) {
  switch (format) {
    case bidsub::v1::DOCUMENT_FORMAT_HTML:
      return "html";
    case bidsub::v1::DOCUMENT_FORMAT_WORDML:
      return "wordml";
    case bidsub::v1::DOCUMENT_FORMAT_PDF:
      return "pdf";
    case bidsub::v1::DOCUMENT_FORMAT_JSON:
      return "json";
    default:
      return "unspecified";
  }
}

model::PortalRequirements ToRequirements(const bidsub::runtime::config::PortalConfig& portal,
                                         const bidsub::runtime::config::OrchestratorConfig& orchestrator) {
  if (portal.name().empty()) {
    throw std::invalid_argument("portal name is required");
  }

  model::PortalRequirements req;
  req.portal = portal.name();

  if (!portal.required_format().empty()) {
    auto format = ParseDocumentFormat(portal.required_format());
    if (!format) {
      throw std::invalid_argument("portal " + portal.name() + ": unknown required_format " + portal.required_format());
    }
    req.required_format = *format;
  }

  req.required_forms.assign(portal.required_forms().begin(), portal.required_forms().end());
  req.required_certifications.assign(portal.required_certifications().begin(), portal.required_certifications().end());
  req.required_fields.assign(portal.required_fields().begin(), portal.required_fields().end());

  if (portal.max_package_bytes() > 0) {
    req.max_package_bytes = portal.max_package_bytes();
  }

  if (portal.has_average_latency()) {
    req.average_latency = util::FromProto(portal.average_latency());
  }

  if (portal.has_delivery_timeout()) {
    req.delivery_timeout = util::FromProto(portal.delivery_timeout());
  } else if (orchestrator.has_default_delivery_timeout()) {
    req.delivery_timeout = util::FromProto(orchestrator.default_delivery_timeout());
  } else {
    req.delivery_timeout = kDefaultDeliveryTimeout;
  }
  if (req.delivery_timeout.count() <= 0) {
    throw std::invalid_argument("portal " + req.portal + ": delivery_timeout must be positive");
  }

  if (portal.max_retries() > 0) {
    req.max_retries = portal.max_retries();
  }

  return req;
}

} // namespace bidsub::config
