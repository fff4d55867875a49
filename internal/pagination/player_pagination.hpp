#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/player.hpp"
#include "internal/model/permissions.hpp"
#include "internal/util/url.hpp"

namespace demonlist::pagination {

// Public player listing, optionally filtered by exact name or ban state.
struct PlayerPagination {
  using Item   = db::model::Player;
  using Filter = db::PlayerFilter;

  static constexpr const char* kName = "PaginatePlayers";

  std::optional<std::string> name;
  std::optional<bool>        banned;

  std::optional<std::int64_t> before;
  std::optional<std::int64_t> after;
  std::optional<std::int64_t> limit;

  model::PermissionSet RequiredPermissions() const {
    return {};
  }

  Filter ToFilter() const;
  void   EncodeFilters(util::QueryString& query) const;

  static std::vector<Item> Fetch(db::Repository& repo, db::Connection& conn, const Filter& filter, const db::Keyset& keyset);

  static std::int64_t IdOf(const Item& player) {
    return player.id;
  }
};

} // namespace demonlist::pagination
