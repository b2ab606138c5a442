#include "document_converter.hpp"

#include "internal/config/portal_profiles.hpp"
#include "internal/packaging/render/html_renderer.hpp"
#include "internal/packaging/render/json_renderer.hpp"
#include "internal/packaging/render/pdf_renderer.hpp"
#include "internal/packaging/render/wordml_renderer.hpp"
#include "internal/util/errors.hpp"

namespace bidsub::packaging {

namespace {

std::unique_ptr<render::FormatRenderer> MakeRenderer(bidsub::v1::DocumentFormat format) {
  switch (format) {
    case bidsub::v1::DOCUMENT_FORMAT_HTML:
      return std::make_unique<render::HtmlRenderer>();
    case bidsub::v1::DOCUMENT_FORMAT_WORDML:
      return std::make_unique<render::WordMlRenderer>();
    case bidsub::v1::DOCUMENT_FORMAT_PDF:
      return std::make_unique<render::PdfRenderer>();
    case bidsub::v1::DOCUMENT_FORMAT_JSON:
      return std::make_unique<render::JsonRenderer>();
    default:
      return nullptr;
  }
}

} // namespace

std::shared_ptr<DocumentConverter> DocumentConverter::WithFormats(const std::vector<bidsub::v1::DocumentFormat>& formats) {
  static const std::vector<bidsub::v1::DocumentFormat> kAll = {
      bidsub::v1::DOCUMENT_FORMAT_HTML,
      bidsub::v1::DOCUMENT_FORMAT_WORDML,
      bidsub::v1::DOCUMENT_FORMAT_PDF,
      bidsub::v1::DOCUMENT_FORMAT_JSON,
  };

  auto converter = std::make_shared<DocumentConverter>();
  for (auto format : formats.empty() ? kAll : formats) {
    auto renderer = MakeRenderer(format);
    if (!renderer) {
      throw util::UnsupportedFormatError(std::string("no renderer for format ") + config::DocumentFormatName(format));
    }
    converter->Register(std::move(renderer));
  }
  return converter;
}

void DocumentConverter::Register(std::unique_ptr<render::FormatRenderer> renderer) {
  const auto format = renderer->Format();
  renderers_[format] = std::move(renderer);
}

std::string DocumentConverter::Convert(const bidsub::v1::BidDocument& document, bidsub::v1::DocumentFormat format) const {
  auto it = renderers_.find(format);
  if (it == renderers_.end()) {
    throw util::UnsupportedFormatError(std::string("format not available: ") + config::DocumentFormatName(format));
  }
  return it->second->Render(document);
}

bool DocumentConverter::Supports(bidsub::v1::DocumentFormat format) const {
  return renderers_.contains(format);
}

std::vector<bidsub::v1::DocumentFormat> DocumentConverter::SupportedFormats() const {
  std::vector<bidsub::v1::DocumentFormat> out;
  out.reserve(renderers_.size());
  for (const auto& [format, _] : renderers_) {
    out.push_back(format);
  }
  return out;
}

} // namespace bidsub::packaging
