#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace demonlist::model {

enum class RecordStatus : std::uint8_t {
  kSubmitted = 0,
  kApproved  = 1,
  kRejected  = 2,
};

constexpr std::string_view ToString(RecordStatus status) {
  switch (status) {
    case RecordStatus::kSubmitted:
      return "submitted";
    case RecordStatus::kApproved:
      return "approved";
    case RecordStatus::kRejected:
      return "rejected";
  }
  return "submitted";
}

// Accepts the lower case names produced by ToString.
std::optional<RecordStatus> ParseRecordStatus(std::string_view value);

} // namespace demonlist::model
