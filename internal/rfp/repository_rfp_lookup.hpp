#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/rfp/rfp_lookup.hpp"

namespace bidsub::rfp {

// RFP lookup backed by the rfp_opportunities table.
class RepositoryRfpLookup final : public RfpLookup {
 public:
  explicit RepositoryRfpLookup(std::shared_ptr<db::Repository> repository);

  std::optional<RfpInfo> Find(const std::string& rfp_id) override;

  // Throws std::runtime_error when the row cannot be written.
  void Upsert(const RfpInfo& info);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace bidsub::rfp
