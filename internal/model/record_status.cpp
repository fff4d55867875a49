#include "record_status.hpp"

namespace demonlist::model {

std::optional<RecordStatus> ParseRecordStatus(std::string_view value) {
  for (auto status : {RecordStatus::kSubmitted, RecordStatus::kApproved, RecordStatus::kRejected}) {
    if (ToString(status) == value) {
      return status;
    }
  }
  return std::nullopt;
}

} // namespace demonlist::model
