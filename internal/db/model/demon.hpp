#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace demonlist::db::model {

/*
  Persistent demon row.

  The name is the natural key. Positions form the ranking: 1..list_size is
  the main list, up to extended_list_size the extended list, anything
  beyond is legacy.
*/
struct Demon {
  std::string                name;
  int                        position    = 0;
  int                        requirement = 100;
  std::optional<std::string> video;
  std::int64_t               verifier  = 0; // player id
  std::int64_t               publisher = 0; // player id
};

} // namespace demonlist::db::model
