#include "pdf_renderer.hpp"

#include <algorithm>
#include <cstdio>
#include <sstream>
#include <vector>

namespace bidsub::packaging::render {

namespace {

std::string SanitizeAscii(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (unsigned char c : text) {
    if (c == '\n' || c == '\t') {
      out.push_back(' ');
    } else {
      out.push_back(c >= 0x20 && c < 0x7F ? static_cast<char>(c) : '?');
    }
  }
  return out;
}

std::string EscapePdfString(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (c == '(' || c == ')' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  return out;
}

// Greedy word wrap; words longer than the width are hard-split.
void Wrap(std::string_view text, std::size_t width, std::vector<std::string>& lines) {
  std::string current;
  size_t      pos = 0;

  while (pos < text.size()) {
    while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\n' || text[pos] == '\t')) ++pos;
    if (pos >= text.size()) break;

    size_t end = text.find_first_of(" \n\t", pos);
    if (end == std::string_view::npos) end = text.size();
    std::string_view word = text.substr(pos, end - pos);
    pos                   = end;

    while (word.size() > width) {
      if (!current.empty()) {
        lines.push_back(std::move(current));
        current.clear();
      }
      lines.emplace_back(word.substr(0, width));
      word.remove_prefix(width);
    }

    if (!current.empty() && current.size() + 1 + word.size() > width) {
      lines.push_back(std::move(current));
      current.clear();
    }
    if (!current.empty()) current.push_back(' ');
    current.append(word);
  }

  if (!current.empty()) lines.push_back(std::move(current));
}

std::string ContentStream(const std::vector<std::string>& lines, size_t begin, size_t end) {
  std::ostringstream out;
  out << "BT\n/F1 10 Tf\n13 TL\n50 770 Td\n";
  for (size_t i = begin; i < end; ++i) {
    if (i != begin) out << "T*\n";
    out << "(" << EscapePdfString(lines[i]) << ") Tj\n";
  }
  out << "ET\n";
  return out.str();
}

} // namespace

std::string PdfRenderer::Render(const bidsub::v1::BidDocument& document) const {
  std::vector<std::string> lines;

  Wrap(SanitizeAscii(document.title()), kLineWidth, lines);
  auto field = [&lines](std::string_view label, const std::string& value) {
    if (value.empty()) return;
    std::string line(label);
    line += ": ";
    line += value;
    Wrap(SanitizeAscii(line), kLineWidth, lines);
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
    lines.emplace_back();
    Wrap(SanitizeAscii(paragraph), kLineWidth, lines);
  }

  const size_t page_count = lines.empty() ? 1 : (lines.size() + kLinesPerPage - 1) / kLinesPerPage;

  // objects: 1 catalog, 2 pages, 3 font, then (page, contents) pairs
  const size_t object_count = 3 + 2 * page_count;

  std::string              pdf = "%PDF-1.4\n";
  std::vector<std::size_t> offsets(object_count + 1, 0);

  auto begin_object = [&](size_t id) {
    offsets[id] = pdf.size();
    pdf += std::to_string(id) + " 0 obj\n";
  };

  begin_object(1);
  pdf += "<< /Type /Catalog /Pages 2 0 R >>\nendobj\n";

  begin_object(2);
  pdf += "<< /Type /Pages /Kids [";
  for (size_t p = 0; p < page_count; ++p) {
    if (p) pdf += " ";
    pdf += std::to_string(4 + 2 * p) + " 0 R";
  }
  pdf += "] /Count " + std::to_string(page_count) + " >>\nendobj\n";

  begin_object(3);
  pdf += "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>\nendobj\n";

  for (size_t p = 0; p < page_count; ++p) {
    const size_t page_id    = 4 + 2 * p;
    const size_t content_id = page_id + 1;

    begin_object(page_id);
    pdf += "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] /Resources << /Font << /F1 3 0 R >> >> /Contents " +
           std::to_string(content_id) + " 0 R >>\nendobj\n";

    const size_t begin  = p * kLinesPerPage;
    const size_t end    = std::min(lines.size(), begin + kLinesPerPage);
    const auto   stream = ContentStream(lines, begin, end);

    begin_object(content_id);
    pdf += "<< /Length " + std::to_string(stream.size()) + " >>\nstream\n" + stream + "endstream\nendobj\n";
  }

  const size_t xref_offset = pdf.size();
  pdf += "xref\n0 " + std::to_string(object_count + 1) + "\n";
  pdf += "0000000000 65535 f \n";

  char entry[32];
  for (size_t id = 1; id <= object_count; ++id) {
    std::snprintf(entry, sizeof(entry), "%010zu 00000 n \n", offsets[id]);
    pdf += entry;
  }

  pdf += "trailer\n<< /Size " + std::to_string(object_count + 1) + " /Root 1 0 R >>\n";
  pdf += "startxref\n" + std::to_string(xref_offset) + "\n%%EOF\n";
  return pdf;
}

} // namespace bidsub::packaging::render
