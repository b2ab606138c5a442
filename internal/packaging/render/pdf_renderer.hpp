#pragma once

#include <cstddef>

#include "format_renderer.hpp"

namespace bidsub::packaging::render {

/*
  Minimal text-only PDF 1.4 writer.

  One Helvetica font, fixed-width wrapping, uncompressed content streams.
  Characters outside printable ASCII are written as '?'.
*/
class PdfRenderer final : public FormatRenderer {
 public:
  static constexpr std::size_t kLineWidth    = 90;
  static constexpr std::size_t kLinesPerPage = 54;

  bidsub::v1::DocumentFormat Format() const override {
    return bidsub::v1::DOCUMENT_FORMAT_PDF;
  }

  std::string Render(const bidsub::v1::BidDocument& document) const override;
};

} // namespace bidsub::packaging::render
