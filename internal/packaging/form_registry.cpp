#include "form_registry.hpp"

#include "internal/util/errors.hpp"

namespace bidsub::packaging {

std::string AttributeValue(const bidsub::v1::BidDocument& document, const std::string& key) {
  for (const auto& attribute : document.attributes()) {
    if (attribute.key() == key) return attribute.value();
  }
  return {};
}

namespace {

model::FormContent Sf1449(const bidsub::v1::BidDocument& doc) {
  return {"SF-1449",
          {{"solicitation_number", doc.solicitation_number()},
           {"offeror_name", doc.vendor_name()},
           {"offeror_address", doc.vendor_address()},
           {"cage_code", doc.cage_code()},
           {"duns_number", doc.duns_number()},
           {"schedule_title", doc.title()},
           {"payment_terms", AttributeValue(doc, "payment_terms")}}};
}

model::FormContent Sf33(const bidsub::v1::BidDocument& doc) {
  return {"SF-33",
          {{"solicitation_number", doc.solicitation_number()},
           {"offeror_name", doc.vendor_name()},
           {"offeror_address", doc.vendor_address()},
           {"cage_code", doc.cage_code()},
           {"offer_acceptance_period_days", AttributeValue(doc, "acceptance_period_days")}}};
}

model::FormContent Sf30(const bidsub::v1::BidDocument& doc) {
  return {"SF-30",
          {{"solicitation_number", doc.solicitation_number()},
           {"contractor_name", doc.vendor_name()},
           {"contractor_address", doc.vendor_address()},
           {"amendment_number", AttributeValue(doc, "amendment_number")},
           {"acknowledged", "true"}}};
}

model::FormContent Sf18(const bidsub::v1::BidDocument& doc) {
  return {"SF-18",
          {{"rfq_number", doc.solicitation_number()},
           {"quoter_name", doc.vendor_name()},
           {"quoter_address", doc.vendor_address()},
           {"duns_number", doc.duns_number()}}};
}

} // namespace

std::shared_ptr<FormRegistry> FormRegistry::Standard() {
  auto registry = std::make_shared<FormRegistry>();
  registry->Register("SF-1449", Sf1449);
  registry->Register("SF-33", Sf33);
  registry->Register("SF-30", Sf30);
  registry->Register("SF-18", Sf18);
  return registry;
}

void FormRegistry::Register(const std::string& form_name, Generator generator) {
  generators_[form_name] = std::move(generator);
}

bool FormRegistry::Has(const std::string& form_name) const {
  return generators_.contains(form_name);
}

model::FormContent FormRegistry::Generate(const std::string& form_name, const bidsub::v1::BidDocument& document) const {
  auto it = generators_.find(form_name);
  if (it == generators_.end()) {
    throw util::AssemblyError("no generator for form " + form_name);
  }
  return it->second(document);
}

std::vector<std::string> FormRegistry::Names() const {
  std::vector<std::string> names;
  names.reserve(generators_.size());
  for (const auto& [name, _] : generators_) names.push_back(name);
  return names;
}

} // namespace bidsub::packaging
