#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "internal/portal/portal_adapter.hpp"
#include "internal/portal/transport/portal_transport.hpp"

namespace bidsub::portal::gsa_ebuy {

/*
  GSA eBuy quote response.

  eBuy keys quotes by RFQ number and expects the vendor CAGE code at the
  top level. The primary document goes out as quote_document.
*/
class GsaEbuyAdapter final : public PortalAdapter {
 public:
  struct Options {
    std::string               name     = "gsa_ebuy";
    std::string               endpoint = "https://www.ebuy.gsa.gov/ebuy/api/quotes";
    std::string               credential;
    std::chrono::milliseconds timeout{30000};
  };

  GsaEbuyAdapter(Options options, std::shared_ptr<transport::PortalTransport> transport);

  std::string Name() const override {
    return options_.name;
  }

  model::DeliveryOutcome Submit(const model::BidDocumentPackage& package) override;

  std::string FormatQuote(const model::BidDocumentPackage& package) const;

 private:
  Options                                     options_;
  std::shared_ptr<transport::PortalTransport> transport_;
};

} // namespace bidsub::portal::gsa_ebuy
