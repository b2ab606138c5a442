#include "response_classifier.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

namespace bidsub::portal::transport {

namespace {

std::string Field(const google::protobuf::Struct& body, const std::string& key) {
  auto it = body.fields().find(key);
  if (it == body.fields().end() || it->second.kind_case() != google::protobuf::Value::kStringValue) {
    return {};
  }
  return it->second.string_value();
}

std::string Describe(const std::string& portal, const TransportResponse& response) {
  std::string message = portal + " returned HTTP " + std::to_string(response.status_code);

  google::protobuf::Struct body;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  if (google::protobuf::util::JsonStringToMessage(response.body, &body, options).ok()) {
    auto detail = Field(body, "message");
    if (detail.empty()) detail = Field(body, "error");
    if (!detail.empty()) message += ": " + detail;
  }
  return message;
}

} // namespace

bool IsRetryableStatus(int status_code) {
  return status_code == 408 || status_code == 425 || status_code == 429 || (status_code >= 500 && status_code <= 599);
}

model::DeliveryOutcome ClassifyResponse(const std::string& portal, const TransportResponse& response) {
  if (response.status_code >= 200 && response.status_code < 300) {
    google::protobuf::Struct body;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    if (!google::protobuf::util::JsonStringToMessage(response.body, &body, options).ok()) {
      return model::DeliveryOutcome::Retryable(portal + " returned an unreadable confirmation body");
    }

    auto confirmation = Field(body, "confirmation_number");
    if (confirmation.empty()) {
      return model::DeliveryOutcome::Retryable(portal + " accepted the submission without a confirmation number");
    }
    return model::DeliveryOutcome::Confirmed(std::move(confirmation));
  }

  if (IsRetryableStatus(response.status_code)) {
    return model::DeliveryOutcome::Retryable(Describe(portal, response));
  }
  return model::DeliveryOutcome::NonRetryable(Describe(portal, response));
}

} // namespace bidsub::portal::transport
