#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "bidsub/v1/types.pb.h"

namespace bidsub::model {

struct PrimaryDocument {
  bidsub::v1::DocumentFormat format = bidsub::v1::DOCUMENT_FORMAT_UNSPECIFIED;
  uint64_t                   size_bytes = 0;

  // base64 of the rendered bytes
  std::string encoded_payload;
};

struct FormContent {
  std::string form_name;

  // Ordered field list; order is part of the form layout.
  std::vector<std::pair<std::string, std::string>> fields;
};

struct Certification {
  std::string name;
  std::string status;
  std::string reference;
};

/*
  Submission package, built fresh for each delivery attempt and discarded
  afterwards.

  submission_key is stable across attempts of the same job so that portals
  and transports can recognise a resubmission.
*/
struct BidDocumentPackage {
  std::string submission_key;
  std::string portal;
  std::string rfp_id;

  PrimaryDocument                    primary_document;
  std::map<std::string, FormContent> forms;
  std::vector<Certification>         certifications;

  // Vendor and contract fields carried over from the bid document.
  std::map<std::string, std::string> fields;
};

} // namespace bidsub::model
