#include "json_renderer.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace bidsub::packaging::render {

std::string JsonRenderer::Render(const bidsub::v1::BidDocument& document) const {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(document, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("json render failed: " + std::string(status.message()));
  }
  return json;
}

} // namespace bidsub::packaging::render
