#include "gsa_ebuy_adapter.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/config/portal_profiles.hpp"
#include "internal/observability/logging.hpp"
#include "internal/portal/transport/response_classifier.hpp"

namespace bidsub::portal::gsa_ebuy {

namespace {

std::string FieldOrEmpty(const model::BidDocumentPackage& package, const std::string& key) {
  auto it = package.fields.find(key);
  return it == package.fields.end() ? std::string() : it->second;
}

} // namespace

GsaEbuyAdapter::GsaEbuyAdapter(Options options, std::shared_ptr<transport::PortalTransport> transport)
    : options_(std::move(options)), transport_(std::move(transport)) {
}

std::string GsaEbuyAdapter::FormatQuote(const model::BidDocumentPackage& package) const {
  google::protobuf::Struct root;
  auto&                    fields = *root.mutable_fields();

  fields["rfq_number"].set_string_value(FieldOrEmpty(package, "solicitation_number"));
  fields["vendor_cage"].set_string_value(FieldOrEmpty(package, "cage_code"));
  fields["technical_approach"].set_string_value(FieldOrEmpty(package, "technical_approach"));
  fields["quote_key"].set_string_value(package.submission_key);

  auto& quote = *fields["quote_document"].mutable_struct_value()->mutable_fields();
  quote["format"].set_string_value(config::DocumentFormatName(package.primary_document.format));
  quote["size_bytes"].set_number_value(static_cast<double>(package.primary_document.size_bytes));
  quote["content_base64"].set_string_value(package.primary_document.encoded_payload);

  auto& contact = *fields["contact_info"].mutable_struct_value()->mutable_fields();
  contact["name"].set_string_value(FieldOrEmpty(package, "vendor_name"));
  contact["address"].set_string_value(FieldOrEmpty(package, "vendor_address"));

  auto* attachments = fields["attachments"].mutable_list_value();
  for (const auto& [name, form] : package.forms) {
    auto& a = *attachments->add_values()->mutable_struct_value()->mutable_fields();
    a["form"].set_string_value(name);
    auto& values = *a["values"].mutable_struct_value()->mutable_fields();
    for (const auto& [key, value] : form.fields) {
      values[key].set_string_value(value);
    }
  }

  auto* certifications = fields["representations"].mutable_list_value();
  for (const auto& cert : package.certifications) {
    auto& c = *certifications->add_values()->mutable_struct_value()->mutable_fields();
    c["name"].set_string_value(cert.name);
    c["status"].set_string_value(cert.status);
    c["reference"].set_string_value(cert.reference);
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(root, &json);
  if (!status.ok()) {
    throw std::runtime_error("ebuy quote encoding failed: " + std::string(status.message()));
  }
  return json;
}

model::DeliveryOutcome GsaEbuyAdapter::Submit(const model::BidDocumentPackage& package) {
  transport::TransportRequest request;
  request.endpoint                   = options_.endpoint;
  request.idempotency_key            = package.submission_key;
  request.body                       = FormatQuote(package);
  request.headers["Content-Type"]    = "application/json";
  request.headers["Idempotency-Key"] = package.submission_key;
  if (!options_.credential.empty()) {
    request.headers["Authorization"] = "Basic " + options_.credential;
  }

  BIDSUB_LOG_INFO("gsa ebuy submit",
                  {observability::StringField("submission_key", package.submission_key),
                   observability::StringField("rfq", FieldOrEmpty(package, "solicitation_number"))});

  transport::TransportResponse response;
  try {
    response = transport_->Post(request, options_.timeout);
  } catch (const std::exception& e) {
    return model::DeliveryOutcome::Retryable(std::string("gsa ebuy transport error: ") + e.what());
  }

  return transport::ClassifyResponse("gsa ebuy", response);
}

} // namespace bidsub::portal::gsa_ebuy
