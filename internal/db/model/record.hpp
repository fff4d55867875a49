#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/record_status.hpp"

namespace demonlist::db::model {

struct Record {
  std::int64_t                     id       = 0;
  int                              progress = 0;
  std::optional<std::string>       video;
  demonlist::model::RecordStatus   status    = demonlist::model::RecordStatus::kSubmitted;
  std::int64_t                     player    = 0;
  std::int64_t                     submitter = 0;
  std::string                      demon;
};

} // namespace demonlist::db::model
