#include "package_assembler.hpp"

#include <algorithm>

#include "internal/util/base64.hpp"

namespace bidsub::packaging {

PackageAssembler::PackageAssembler(std::shared_ptr<const DocumentConverter> converter,
                                   std::shared_ptr<const FormRegistry>      forms)
    : converter_(std::move(converter)), forms_(std::move(forms)) {
}

model::BidDocumentPackage PackageAssembler::Assemble(const bidsub::v1::BidDocument& document,
                                                     const model::PortalRequirements& requirements) const {
  model::BidDocumentPackage package;
  package.portal = requirements.portal;
  package.rfp_id = document.rfp_id();

  const auto rendered = converter_->Convert(document, requirements.required_format);
  package.primary_document.format = requirements.required_format;
  package.primary_document.size_bytes = rendered.size();
  package.primary_document.encoded_payload = util::Base64Encode(rendered);

  for (const auto& form_name : requirements.required_forms) {
    package.forms[form_name] = forms_->Generate(form_name, document);
  }

  for (const auto& cert_name : requirements.required_certifications) {
    package.certifications.push_back({cert_name, "included", cert_name + "_cert"});
  }

  package.fields["document_id"]         = document.document_id();
  package.fields["title"]               = document.title();
  package.fields["solicitation_number"] = document.solicitation_number();
  package.fields["vendor_name"]         = document.vendor_name();
  package.fields["vendor_address"]      = document.vendor_address();
  package.fields["cage_code"]           = document.cage_code();
  package.fields["duns_number"]         = document.duns_number();
  for (const auto& attribute : document.attributes()) {
    package.fields.emplace(attribute.key(), attribute.value());
  }

  return package;
}

std::vector<std::string> PackageAssembler::Validate(const model::BidDocumentPackage& package,
                                                    const model::PortalRequirements& requirements) const {
  std::vector<std::string> violations;

  if (package.primary_document.size_bytes > requirements.max_package_bytes) {
    violations.push_back("document size " + std::to_string(package.primary_document.size_bytes) +
                         " bytes exceeds portal limit of " + std::to_string(requirements.max_package_bytes) + " bytes");
  }

  for (const auto& form_name : requirements.required_forms) {
    if (!package.forms.contains(form_name)) {
      violations.push_back("missing required form: " + form_name);
    }
  }

  for (const auto& cert_name : requirements.required_certifications) {
    const bool present = std::any_of(package.certifications.begin(), package.certifications.end(),
                                     [&](const model::Certification& c) { return c.name == cert_name; });
    if (!present) {
      violations.push_back("missing required certification: " + cert_name);
    }
  }

  for (const auto& field : requirements.required_fields) {
    auto it = package.fields.find(field);
    if (it == package.fields.end() || it->second.empty()) {
      violations.push_back("missing required field: " + field);
    }
  }

  return violations;
}

} // namespace bidsub::packaging
