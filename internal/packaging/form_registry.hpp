#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "bidsub/v1/bid.pb.h"
#include "internal/model/bid_package.hpp"

namespace bidsub::packaging {

/*
  Named generators for the government forms a portal may mandate.

  Generators fill form fields from the bid's vendor and contract data and
  must be pure functions of the document.
*/
class FormRegistry {
 public:
  using Generator = std::function<model::FormContent(const bidsub::v1::BidDocument&)>;

  // SF-1449, SF-33, SF-30, SF-18.
  static std::shared_ptr<FormRegistry> Standard();

  void Register(const std::string& form_name, Generator generator);

  bool Has(const std::string& form_name) const;

  // Throws AssemblyError when no generator is registered for form_name.
  model::FormContent Generate(const std::string& form_name, const bidsub::v1::BidDocument& document) const;

  std::vector<std::string> Names() const;

 private:
  std::map<std::string, Generator> generators_;
};

// Value of the first attribute named key, or empty.
std::string AttributeValue(const bidsub::v1::BidDocument& document, const std::string& key);

} // namespace bidsub::packaging
