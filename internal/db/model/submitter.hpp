#pragma once

#include <cstdint>
#include <string>

namespace demonlist::db::model {

struct Submitter {
  std::int64_t id = 0;
  std::string  ip;
  bool         banned = false;
};

} // namespace demonlist::db::model
