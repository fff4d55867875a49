#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/permissions.hpp"
#include "internal/model/record_status.hpp"

namespace demonlist::db {

/*
  Keyset window over a table's integer primary key.

  Rows with after < id < before, ordered by id, at most `limit` rows.
  `descending` walks the window from the top, which is how "the rows right
  below a cursor" are found.
*/
struct Keyset {
  std::optional<std::int64_t> after;
  std::optional<std::int64_t> before;
  std::size_t                 limit      = 50;
  bool                        descending = false;
};

struct PlayerFilter {
  std::optional<std::string> name;
  std::optional<bool>        banned;
};

struct RecordFilter {
  std::optional<demonlist::model::RecordStatus> status;
  std::optional<std::int64_t>        player;
  std::optional<std::string>         demon;
  std::optional<std::int64_t>        submitter;
};

struct UserFilter {
  std::optional<std::string> name;
  std::optional<std::string> display_name;
  // users holding any of these permissions; empty matches everyone
  demonlist::model::PermissionSet has_permissions;
};

} // namespace demonlist::db
