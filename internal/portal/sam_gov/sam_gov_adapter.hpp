#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "internal/portal/portal_adapter.hpp"
#include "internal/portal/transport/portal_transport.hpp"

namespace bidsub::portal::sam_gov {

/*
  SAM.gov bid response submission.

  The package is formatted as a bid_response JSON document and posted
  through the transport. The API key travels in the Authorization header.
*/
class SamGovAdapter final : public PortalAdapter {
 public:
  struct Options {
    std::string               name     = "sam_gov";
    std::string               endpoint = "https://api.sam.gov/opportunities/submissions";
    std::string               api_key;
    std::chrono::milliseconds timeout{30000};
  };

  SamGovAdapter(Options options, std::shared_ptr<transport::PortalTransport> transport);

  std::string Name() const override {
    return options_.name;
  }

  model::DeliveryOutcome Submit(const model::BidDocumentPackage& package) override;

  std::string FormatSubmission(const model::BidDocumentPackage& package) const;

 private:
  Options                                    options_;
  std::shared_ptr<transport::PortalTransport> transport_;
};

} // namespace bidsub::portal::sam_gov
