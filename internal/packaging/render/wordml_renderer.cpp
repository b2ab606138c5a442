#include "wordml_renderer.hpp"

#include <sstream>

namespace bidsub::packaging::render {

namespace {

void Paragraph(std::ostringstream& out, std::string_view text, const char* style = nullptr) {
  out << "<w:p>";
  if (style) {
    out << "<w:pPr><w:pStyle w:val=\"" << style << "\"/></w:pPr>";
  }
  out << "<w:r><w:t xml:space=\"preserve\">" << EscapeMarkup(text) << "</w:t></w:r></w:p>\n";
}

} // namespace

std::string WordMlRenderer::Render(const bidsub::v1::BidDocument& document) const {
  std::ostringstream out;

  out << "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
      << "<?mso-application progid=\"Word.Document\"?>\n"
      << "<w:wordDocument xmlns:w=\"http://schemas.microsoft.com/office/word/2003/wordml\">\n"
      << "<w:body>\n";

  Paragraph(out, document.title(), "Title");

  auto field = [&out](std::string_view label, const std::string& value) {
    if (value.empty()) return;
    std::string line(label);
    line += ": ";
    line += value;
    Paragraph(out, line);
  };
  field("Solicitation", document.solicitation_number());
  field("Vendor", document.vendor_name());
  field("Address", document.vendor_address());
  field("CAGE", document.cage_code());
  field("DUNS", document.duns_number());
  for (const auto& attribute : document.attributes()) {
    field(attribute.key(), attribute.value());
  }

  for (const auto& paragraph : SplitParagraphs(document.content())) {
    Paragraph(out, paragraph);
  }

  out << "</w:body>\n</w:wordDocument>\n";
  return out.str();
}

} // namespace bidsub::packaging::render
