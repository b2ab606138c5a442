#pragma once

#include <memory>
#include <string>
#include <vector>

#include "bidsub/v1/bid.pb.h"
#include "internal/model/bid_package.hpp"
#include "internal/model/portal_requirements.hpp"
#include "internal/packaging/document_converter.hpp"
#include "internal/packaging/form_registry.hpp"

namespace bidsub::packaging {

/*
  Builds and validates submission packages.

  Assemble is deterministic for a fixed document and profile. The caller
  stamps submission_key.
*/
class PackageAssembler {
 public:
  PackageAssembler(std::shared_ptr<const DocumentConverter> converter, std::shared_ptr<const FormRegistry> forms);

  // Throws UnsupportedFormatError or AssemblyError.
  model::BidDocumentPackage Assemble(const bidsub::v1::BidDocument& document,
                                     const model::PortalRequirements& requirements) const;

  // Returns every violation found; empty means ready to submit.
  std::vector<std::string> Validate(const model::BidDocumentPackage& package,
                                    const model::PortalRequirements& requirements) const;

 private:
  std::shared_ptr<const DocumentConverter> converter_;
  std::shared_ptr<const FormRegistry>      forms_;
};

} // namespace bidsub::packaging
