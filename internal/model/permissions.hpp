#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace demonlist::model {

enum class Permission : std::uint16_t {
  kExtendedAccess       = 0x0001,
  kListHelper           = 0x0002,
  kListModerator        = 0x0004,
  kListAdministrator    = 0x0008,
  kLeaderboardModerator = 0x0010,
  kModerator            = 0x2000,
  kAdministrator        = 0x4000,
};

std::string_view PermissionName(Permission permission);

/*
  Unordered set of capability flags.

  Authorization is "any of": a granted set satisfies a required set
  when the two intersect. An empty required set is always satisfied.
*/
class PermissionSet {
 public:
  PermissionSet() = default;
  PermissionSet(std::initializer_list<Permission> permissions);

  static PermissionSet FromBits(std::uint16_t bits);

  std::uint16_t Bits() const {
    return bits_;
  }

  bool Empty() const {
    return bits_ == 0;
  }

  bool Contains(Permission permission) const;
  bool Intersects(const PermissionSet& other) const;

  std::vector<Permission> ToVector() const;

  // Comma separated permission names, e.g. "ListModerator,ListAdministrator"
  std::string ToString() const;

  PermissionSet operator|(const PermissionSet& other) const;
  PermissionSet operator&(const PermissionSet& other) const;
  PermissionSet operator^(const PermissionSet& other) const;
  PermissionSet& operator|=(const PermissionSet& other);

  bool operator==(const PermissionSet& other) const {
    return bits_ == other.bits_;
  }
  bool operator!=(const PermissionSet& other) const {
    return bits_ != other.bits_;
  }

 private:
  std::uint16_t bits_ = 0;
};

// ListHelper, ListModerator, ListAdministrator
PermissionSet ListTeam();

// Permissions the holder of `granted` may hand out to (or take away from) other users.
PermissionSet AssignableBy(const PermissionSet& granted);

} // namespace demonlist::model
