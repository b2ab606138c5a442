#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "bidsub/v1/bid.pb.h"
#include "bidsub/v1/types.pb.h"

namespace bidsub::packaging::render {

/*
  Renders a bid document into one output format.

  Implementations must be deterministic: the same document always renders
  to the same bytes.
*/
class FormatRenderer {
 public:
  virtual ~FormatRenderer() = default;

  virtual bidsub::v1::DocumentFormat Format() const = 0;

  virtual std::string Render(const bidsub::v1::BidDocument& document) const = 0;
};

// Splits plain content on blank lines; single newlines stay inside a paragraph.
std::vector<std::string> SplitParagraphs(std::string_view content);

// Escapes &, <, >, " and ' for XML and HTML text.
std::string EscapeMarkup(std::string_view text);

} // namespace bidsub::packaging::render
