#include "format_renderer.hpp"

namespace bidsub::packaging::render {

std::vector<std::string> SplitParagraphs(std::string_view content) {
  std::vector<std::string> out;
  std::string              current;

  size_t pos = 0;
  while (pos <= content.size()) {
    size_t end = content.find('\n', pos);
    if (end == std::string_view::npos) end = content.size();

    std::string_view line = content.substr(pos, end - pos);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

    if (line.find_first_not_of(" \t") == std::string_view::npos) {
      if (!current.empty()) {
        out.push_back(std::move(current));
        current.clear();
      }
    } else {
      if (!current.empty()) current.push_back('\n');
      current.append(line);
    }

    pos = end + 1;
  }

  if (!current.empty()) out.push_back(std::move(current));
  return out;
}

std::string EscapeMarkup(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      case '\'':
        out += "&apos;";
        break;
      default:
        out.push_back(c);
    }
  }
  return out;
}

} // namespace bidsub::packaging::render
