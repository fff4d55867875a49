#include "player_pagination.hpp"

namespace demonlist::pagination {

PlayerPagination::Filter PlayerPagination::ToFilter() const {
  Filter filter;
  filter.name   = name;
  filter.banned = banned;
  return filter;
}

void PlayerPagination::EncodeFilters(util::QueryString& query) const {
  if (name) query.Add("name", *name);
  if (banned) query.Add("banned", *banned ? "true" : "false");
}

std::vector<PlayerPagination::Item> PlayerPagination::Fetch(db::Repository& repo, db::Connection& conn, const Filter& filter,
                                                            const db::Keyset& keyset) {
  return repo.ListPlayers(conn, filter, keyset);
}

} // namespace demonlist::pagination
