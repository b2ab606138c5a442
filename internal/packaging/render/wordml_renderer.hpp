#pragma once

#include "format_renderer.hpp"

namespace bidsub::packaging::render {

/*
  Flat WordprocessingML (Word 2003 XML) document.

  A single XML file that office suites open directly; no zip container.
*/
class WordMlRenderer final : public FormatRenderer {
 public:
  bidsub::v1::DocumentFormat Format() const override {
    return bidsub::v1::DOCUMENT_FORMAT_WORDML;
  }

  std::string Render(const bidsub::v1::BidDocument& document) const override;
};

} // namespace bidsub::packaging::render
