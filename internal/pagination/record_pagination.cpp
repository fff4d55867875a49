#include "record_pagination.hpp"

namespace demonlist::pagination {

model::PermissionSet RecordPagination::RequiredPermissions() const {
  if (status == model::RecordStatus::kApproved) {
    return {};
  }
  return model::ListTeam();
}

RecordPagination::Filter RecordPagination::ToFilter() const {
  Filter filter;
  filter.status    = status;
  filter.player    = player;
  filter.demon     = demon;
  filter.submitter = submitter;
  return filter;
}

void RecordPagination::EncodeFilters(util::QueryString& query) const {
  if (status) query.Add("status", model::ToString(*status));
  if (player) query.Add("player", static_cast<long long>(*player));
  if (demon) query.Add("demon", *demon);
  if (submitter) query.Add("submitter", static_cast<long long>(*submitter));
}

std::vector<RecordPagination::Item> RecordPagination::Fetch(db::Repository& repo, db::Connection& conn, const Filter& filter,
                                                            const db::Keyset& keyset) {
  return repo.ListRecords(conn, filter, keyset);
}

} // namespace demonlist::pagination
