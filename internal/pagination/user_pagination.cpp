#include "user_pagination.hpp"

namespace demonlist::pagination {

UserPagination::Filter UserPagination::ToFilter() const {
  Filter filter;
  filter.name            = name;
  filter.display_name    = display_name;
  filter.has_permissions = has;
  return filter;
}

void UserPagination::EncodeFilters(util::QueryString& query) const {
  if (name) query.Add("name", *name);
  if (display_name) query.Add("display_name", *display_name);
  if (!has.Empty()) query.Add("has", static_cast<long long>(has.Bits()));
}

std::vector<UserPagination::Item> UserPagination::Fetch(db::Repository& repo, db::Connection& conn, const Filter& filter,
                                                        const db::Keyset& keyset) {
  return repo.ListUsers(conn, filter, keyset);
}

} // namespace demonlist::pagination
