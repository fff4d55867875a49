#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/permissions.hpp"

namespace demonlist::db::model {

/*
  Account row.

  password_hash doubles as the secret material access tokens are signed
  with, so replacing it invalidates every token issued before.
*/
struct User {
  std::int64_t                    id = 0;
  std::string                     name;
  std::optional<std::string>      display_name;
  std::optional<std::string>      youtube_channel;
  std::string                     password_hash;
  demonlist::model::PermissionSet permissions;
};

} // namespace demonlist::db::model
