#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/packaging/package_assembler.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/bid_fixtures.hpp"

namespace {

using bidsub::model::PortalRequirements;
using bidsub::packaging::DocumentConverter;
using bidsub::packaging::FormRegistry;
using bidsub::packaging::PackageAssembler;
using namespace bidsub::v1;

PackageAssembler MakeAssembler() {
  return PackageAssembler(DocumentConverter::WithFormats({}), FormRegistry::Standard());
}

PortalRequirements SamProfile() {
  PortalRequirements req;
  req.portal                  = "sam_gov";
  req.required_format         = DOCUMENT_FORMAT_PDF;
  req.required_forms          = {"SF-1449"};
  req.required_certifications = {"far_52_204_24"};
  req.required_fields         = {"solicitation_number", "cage_code"};
  return req;
}

void TestAssembleBuildsCompletePackage() {
  auto assembler = MakeAssembler();
  auto req       = SamProfile();
  auto package   = assembler.Assemble(bidsub::testing::SampleBid(), req);

  assert(package.portal == "sam_gov");
  assert(package.rfp_id == "rfp-1");
  assert(package.submission_key.empty());
  assert(package.primary_document.format == DOCUMENT_FORMAT_PDF);
  assert(package.primary_document.size_bytes > 0);
  assert(!package.primary_document.encoded_payload.empty());

  assert(package.forms.size() == 1);
  const auto& sf1449 = package.forms.at("SF-1449");
  assert(sf1449.form_name == "SF-1449");
  assert(std::find(sf1449.fields.begin(), sf1449.fields.end(), std::make_pair(std::string("payment_terms"), std::string("net 30"))) !=
         sf1449.fields.end());

  assert(package.certifications.size() == 1);
  assert(package.certifications[0].name == "far_52_204_24");

  assert(package.fields.at("cage_code") == "01ABC");
  assert(package.fields.at("payment_terms") == "net 30");

  assert(assembler.Validate(package, req).empty());
}

void TestAssembleIsDeterministic() {
  auto assembler = MakeAssembler();
  auto req       = SamProfile();
  auto doc       = bidsub::testing::SampleBid();

  auto first  = assembler.Assemble(doc, req);
  auto second = assembler.Assemble(doc, req);
  assert(first.primary_document.encoded_payload == second.primary_document.encoded_payload);
  assert(first.fields == second.fields);
}

void TestValidateReportsEveryViolation() {
  auto assembler = MakeAssembler();
  auto req       = SamProfile();
  req.required_forms    = {"SF-1449", "SF-33"};
  req.max_package_bytes = 10;

  auto package = assembler.Assemble(bidsub::testing::SampleBid(), req);
  package.forms.clear();

  auto violations = assembler.Validate(package, req);
  assert(violations.size() == 3);
  assert(violations[0].find("exceeds portal limit of 10 bytes") != std::string::npos);
  assert(violations[1] == "missing required form: SF-1449");
  assert(violations[2] == "missing required form: SF-33");
}

void TestValidateMissingCertificationAndField() {
  auto assembler = MakeAssembler();
  auto req       = SamProfile();

  auto doc = bidsub::testing::SampleBid();
  doc.clear_cage_code();
  auto package = assembler.Assemble(doc, req);
  package.certifications.clear();

  auto violations = assembler.Validate(package, req);
  assert(violations.size() == 2);
  assert(violations[0] == "missing required certification: far_52_204_24");
  assert(violations[1] == "missing required field: cage_code");
}

void TestUnknownFormIsAssemblyError() {
  auto assembler = MakeAssembler();
  auto req       = SamProfile();
  req.required_forms = {"SF-9999"};

  bool threw = false;
  try {
    (void)assembler.Assemble(bidsub::testing::SampleBid(), req);
  } catch (const bidsub::util::AssemblyError& e) {
    threw = std::string(e.what()).find("SF-9999") != std::string::npos;
  }
  assert(threw);
}

void TestDisabledFormatPropagates() {
  PackageAssembler assembler(DocumentConverter::WithFormats({DOCUMENT_FORMAT_HTML}), FormRegistry::Standard());

  bool threw = false;
  try {
    (void)assembler.Assemble(bidsub::testing::SampleBid(), SamProfile());
  } catch (const bidsub::util::UnsupportedFormatError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestAssembleBuildsCompletePackage();
  TestAssembleIsDeterministic();
  TestValidateReportsEveryViolation();
  TestValidateMissingCertificationAndField();
  TestUnknownFormIsAssemblyError();
  TestDisabledFormatPropagates();

  std::cout << "bidsub_unit_package_assembler: pass\n";
  return 0;
}
