#pragma once

#include <cstdint>
#include <string>

namespace demonlist::db::model {

struct Player {
  std::int64_t id = 0;
  std::string  name;
  bool         banned = false;
};

} // namespace demonlist::db::model
