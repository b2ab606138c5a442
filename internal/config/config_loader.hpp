#pragma once

#include <string>

#include <google/protobuf/message.h>

#include "bidsub/v1/bid.pb.h"
#include "config/config.pb.h"

namespace bidsub::config {

/*
  Loads protobuf messages from YAML files.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected. Scalars bound for string, Duration or Timestamp fields are
  taken verbatim, so duns_number: 012345678 keeps its leading zero; the
  same goes for quoted or !!str scalars anywhere.
*/
class ConfigLoader {
 public:
  static bidsub::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static bidsub::v1::BidDocument LoadBidDocument(const std::string& path);

  // Throws std::runtime_error on unreadable YAML or schema mismatch.
  static void LoadMessageFromYaml(const std::string& path, google::protobuf::Message* message);
};

} // namespace bidsub::config
