#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/user.hpp"
#include "internal/model/permissions.hpp"
#include "internal/util/url.hpp"

namespace demonlist::pagination {

// Moderator or Administrator on external requests.
struct UserPagination {
  using Item   = db::model::User;
  using Filter = db::UserFilter;

  static constexpr const char* kName = "PaginateUsers";

  std::optional<std::string> name;
  std::optional<std::string> display_name;
  model::PermissionSet       has;

  std::optional<std::int64_t> before;
  std::optional<std::int64_t> after;
  std::optional<std::int64_t> limit;

  model::PermissionSet RequiredPermissions() const {
    return {model::Permission::kModerator, model::Permission::kAdministrator};
  }

  Filter ToFilter() const;
  void   EncodeFilters(util::QueryString& query) const;

  static std::vector<Item> Fetch(db::Repository& repo, db::Connection& conn, const Filter& filter, const db::Keyset& keyset);

  static std::int64_t IdOf(const Item& user) {
    return user.id;
  }
};

} // namespace demonlist::pagination
