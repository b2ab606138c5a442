#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "bidsub/v1/bid.pb.h"
#include "bidsub/v1/types.pb.h"
#include "internal/packaging/render/format_renderer.hpp"

namespace bidsub::packaging {

/*
  Renders bid documents into the formats enabled for this deployment.

  Which renderers exist is a deployment capability; asking for a format
  without a renderer throws UnsupportedFormatError.
*/
class DocumentConverter {
 public:
  DocumentConverter() = default;

  // Registers the built-in renderers for the given formats. Empty means all.
  static std::shared_ptr<DocumentConverter> WithFormats(const std::vector<bidsub::v1::DocumentFormat>& formats);

  void Register(std::unique_ptr<render::FormatRenderer> renderer);

  std::string Convert(const bidsub::v1::BidDocument& document, bidsub::v1::DocumentFormat format) const;

  bool Supports(bidsub::v1::DocumentFormat format) const;

  std::vector<bidsub::v1::DocumentFormat> SupportedFormats() const;

 private:
  std::map<bidsub::v1::DocumentFormat, std::unique_ptr<render::FormatRenderer>> renderers_;
};

} // namespace bidsub::packaging
