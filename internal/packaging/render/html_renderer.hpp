#pragma once

#include "format_renderer.hpp"

namespace bidsub::packaging::render {

// Standalone HTML page. Uses content_html verbatim when present.
class HtmlRenderer final : public FormatRenderer {
 public:
  bidsub::v1::DocumentFormat Format() const override {
    return bidsub::v1::DOCUMENT_FORMAT_HTML;
  }

  std::string Render(const bidsub::v1::BidDocument& document) const override;
};

} // namespace bidsub::packaging::render
