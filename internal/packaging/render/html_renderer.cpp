#include "html_renderer.hpp"

#include <sstream>

namespace bidsub::packaging::render {

std::string HtmlRenderer::Render(const bidsub::v1::BidDocument& document) const {
  std::ostringstream out;

  out << "<!DOCTYPE html>\n"
      << "<html>\n<head>\n<meta charset=\"utf-8\">\n"
      << "<title>" << EscapeMarkup(document.title()) << "</title>\n"
      << "</head>\n<body>\n";

  out << "<h1>" << EscapeMarkup(document.title()) << "</h1>\n";

  out << "<table class=\"bid-header\">\n";
  auto row = [&out](const char* label, const std::string& value) {
    if (value.empty()) return;
    out << "<tr><th>" << EscapeMarkup(label) << "</th><td>" << EscapeMarkup(value) << "</td></tr>\n";
  };
  row("Solicitation", document.solicitation_number());
  row("Vendor", document.vendor_name());
  row("Address", document.vendor_address());
  row("CAGE", document.cage_code());
  row("DUNS", document.duns_number());
  for (const auto& attribute : document.attributes()) {
    row(attribute.key().c_str(), attribute.value());
  }
  out << "</table>\n";

  if (!document.content_html().empty()) {
    out << document.content_html() << "\n";
  } else {
    for (const auto& paragraph : SplitParagraphs(document.content())) {
      out << "<p>" << EscapeMarkup(paragraph) << "</p>\n";
    }
  }

  out << "</body>\n</html>\n";
  return out.str();
}

} // namespace bidsub::packaging::render
