#include "sam_gov_adapter.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/config/portal_profiles.hpp"
#include "internal/observability/logging.hpp"
#include "internal/portal/transport/response_classifier.hpp"

namespace bidsub::portal::sam_gov {

namespace {

std::string FieldOrEmpty(const model::BidDocumentPackage& package, const std::string& key) {
  auto it = package.fields.find(key);
  return it == package.fields.end() ? std::string() : it->second;
}

} // namespace

SamGovAdapter::SamGovAdapter(Options options, std::shared_ptr<transport::PortalTransport> transport)
    : options_(std::move(options)), transport_(std::move(transport)) {
}

std::string SamGovAdapter::FormatSubmission(const model::BidDocumentPackage& package) const {
  google::protobuf::Struct root;
  auto&                    fields = *root.mutable_fields();

  fields["submission_type"].set_string_value("bid_response");
  fields["solicitation_number"].set_string_value(FieldOrEmpty(package, "solicitation_number"));

  auto& vendor = *fields["vendor_info"].mutable_struct_value()->mutable_fields();
  vendor["cage_code"].set_string_value(FieldOrEmpty(package, "cage_code"));
  vendor["duns_number"].set_string_value(FieldOrEmpty(package, "duns_number"));
  vendor["name"].set_string_value(FieldOrEmpty(package, "vendor_name"));
  vendor["address"].set_string_value(FieldOrEmpty(package, "vendor_address"));

  auto* documents = fields["documents"].mutable_list_value();
  auto& primary   = *documents->add_values()->mutable_struct_value()->mutable_fields();
  primary["type"].set_string_value("primary_bid");
  primary["format"].set_string_value(config::DocumentFormatName(package.primary_document.format));
  primary["size_bytes"].set_number_value(static_cast<double>(package.primary_document.size_bytes));
  primary["content_base64"].set_string_value(package.primary_document.encoded_payload);

  auto* certifications = fields["certifications"].mutable_list_value();
  for (const auto& cert : package.certifications) {
    auto& c = *certifications->add_values()->mutable_struct_value()->mutable_fields();
    c["name"].set_string_value(cert.name);
    c["status"].set_string_value(cert.status);
    c["reference"].set_string_value(cert.reference);
  }

  auto& forms = *fields["forms"].mutable_struct_value()->mutable_fields();
  for (const auto& [name, form] : package.forms) {
    auto& f = *forms[name].mutable_struct_value()->mutable_fields();
    for (const auto& [key, value] : form.fields) {
      f[key].set_string_value(value);
    }
  }

  auto& metadata = *fields["metadata"].mutable_struct_value()->mutable_fields();
  metadata["submitted_via"].set_string_value("bid-submitter");
  metadata["document_id"].set_string_value(FieldOrEmpty(package, "document_id"));
  metadata["submission_key"].set_string_value(package.submission_key);

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(root, &json);
  if (!status.ok()) {
    throw std::runtime_error("sam.gov payload encoding failed: " + std::string(status.message()));
  }
  return json;
}

model::DeliveryOutcome SamGovAdapter::Submit(const model::BidDocumentPackage& package) {
  transport::TransportRequest request;
  request.endpoint                   = options_.endpoint;
  request.idempotency_key            = package.submission_key;
  request.body                       = FormatSubmission(package);
  request.headers["Content-Type"]    = "application/json";
  request.headers["Idempotency-Key"] = package.submission_key;
  if (!options_.api_key.empty()) {
    request.headers["Authorization"] = "Bearer " + options_.api_key;
  }

  BIDSUB_LOG_INFO("sam.gov submit",
                  {observability::StringField("submission_key", package.submission_key),
                   observability::StringField("solicitation", FieldOrEmpty(package, "solicitation_number"))});

  transport::TransportResponse response;
  try {
    response = transport_->Post(request, options_.timeout);
  } catch (const std::exception& e) {
    return model::DeliveryOutcome::Retryable(std::string("sam.gov transport error: ") + e.what());
  }

  return transport::ClassifyResponse("sam.gov", response);
}

} // namespace bidsub::portal::sam_gov
