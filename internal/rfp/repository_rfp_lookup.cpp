#include "repository_rfp_lookup.hpp"

#include <stdexcept>

namespace bidsub::rfp {

RepositoryRfpLookup::RepositoryRfpLookup(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::optional<RfpInfo> RepositoryRfpLookup::Find(const std::string& rfp_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetRfp(*tx, rfp_id);
  tx->Commit();

  if (!record) {
    return std::nullopt;
  }

  RfpInfo info;
  info.rfp_id              = record->rfp_id;
  info.solicitation_number = record->solicitation_number;
  info.title               = record->title;
  info.agency              = record->agency;
  info.response_deadline   = util::FromUnixMillis(record->response_deadline_ms);
  return info;
}

void RepositoryRfpLookup::Upsert(const RfpInfo& info) {
  if (info.rfp_id.empty()) {
    throw std::invalid_argument("rfp_id must not be empty");
  }

  db::model::RfpRecord record;
  record.rfp_id               = info.rfp_id;
  record.solicitation_number  = info.solicitation_number;
  record.title                = info.title;
  record.agency               = info.agency;
  record.response_deadline_ms = util::ToUnixMillis(info.response_deadline);

  auto tx     = repository_->Begin();
  auto result = repository_->UpsertRfp(*tx, record);
  if (!result) {
    tx->Rollback();
    throw std::runtime_error("rfp upsert failed: " + result.Describe());
  }
  tx->Commit();
}

} // namespace bidsub::rfp
