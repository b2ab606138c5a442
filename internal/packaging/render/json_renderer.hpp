#pragma once

#include "format_renderer.hpp"

namespace bidsub::packaging::render {

// Raw structured data: the protobuf JSON encoding of the bid document.
class JsonRenderer final : public FormatRenderer {
 public:
  bidsub::v1::DocumentFormat Format() const override {
    return bidsub::v1::DOCUMENT_FORMAT_JSON;
  }

  std::string Render(const bidsub::v1::BidDocument& document) const override;
};

} // namespace bidsub::packaging::render
