#pragma once

#include <string>

#include "bidsub/v1/bid.pb.h"

namespace bidsub::testing {

inline bidsub::v1::BidDocument SampleBid() {
  bidsub::v1::BidDocument doc;
  doc.set_document_id("doc-1");
  doc.set_rfp_id("rfp-1");
  doc.set_title("Network Modernization");
  doc.set_content("Phase one replaces edge routers.\n\nPhase two upgrades the core.");
  doc.set_solicitation_number("W912DY-26-R-0042");
  doc.set_vendor_name("Acme Federal LLC");
  doc.set_vendor_address("100 Main Street, Arlington VA");
  doc.set_cage_code("01ABC");
  doc.set_duns_number("012345678");

  auto* attribute = doc.add_attributes();
  attribute->set_key("payment_terms");
  attribute->set_value("net 30");
  return doc;
}

} // namespace bidsub::testing
