#include "permissions.hpp"

#include <array>

namespace demonlist::model {

namespace {

constexpr std::array<Permission, 7> kAllPermissions = {
    Permission::kExtendedAccess, Permission::kListHelper, Permission::kListModerator, Permission::kListAdministrator,
    Permission::kLeaderboardModerator, Permission::kModerator, Permission::kAdministrator,
};

std::uint16_t Bit(Permission permission) {
  return static_cast<std::uint16_t>(permission);
}

} // namespace

std::string_view PermissionName(Permission permission) {
  switch (permission) {
    case Permission::kExtendedAccess:
      return "ExtendedAccess";
    case Permission::kListHelper:
      return "ListHelper";
    case Permission::kListModerator:
      return "ListModerator";
    case Permission::kListAdministrator:
      return "ListAdministrator";
    case Permission::kLeaderboardModerator:
      return "LeaderboardModerator";
    case Permission::kModerator:
      return "Moderator";
    case Permission::kAdministrator:
      return "Administrator";
  }
  return "Unknown";
}

PermissionSet::PermissionSet(std::initializer_list<Permission> permissions) {
  for (auto permission : permissions) {
    bits_ |= Bit(permission);
  }
}

PermissionSet PermissionSet::FromBits(std::uint16_t bits) {
  PermissionSet set;
  for (auto permission : kAllPermissions) {
    set.bits_ |= bits & Bit(permission);
  }
  return set;
}

bool PermissionSet::Contains(Permission permission) const {
  return (bits_ & Bit(permission)) != 0;
}

bool PermissionSet::Intersects(const PermissionSet& other) const {
  return (bits_ & other.bits_) != 0;
}

std::vector<Permission> PermissionSet::ToVector() const {
  std::vector<Permission> out;
  for (auto permission : kAllPermissions) {
    if (Contains(permission)) out.push_back(permission);
  }
  return out;
}

std::string PermissionSet::ToString() const {
  std::string out;
  for (auto permission : ToVector()) {
    if (!out.empty()) out += ',';
    out += PermissionName(permission);
  }
  return out;
}

PermissionSet PermissionSet::operator|(const PermissionSet& other) const {
  return FromBits(bits_ | other.bits_);
}

PermissionSet PermissionSet::operator&(const PermissionSet& other) const {
  return FromBits(bits_ & other.bits_);
}

PermissionSet PermissionSet::operator^(const PermissionSet& other) const {
  return FromBits(bits_ ^ other.bits_);
}

PermissionSet& PermissionSet::operator|=(const PermissionSet& other) {
  bits_ |= other.bits_;
  return *this;
}

PermissionSet ListTeam() {
  return {Permission::kListHelper, Permission::kListModerator, Permission::kListAdministrator};
}

PermissionSet AssignableBy(const PermissionSet& granted) {
  PermissionSet assignable;
  if (granted.Contains(Permission::kListAdministrator)) {
    assignable |= PermissionSet{Permission::kListHelper, Permission::kListModerator};
  }
  if (granted.Contains(Permission::kAdministrator)) {
    assignable |= PermissionSet{Permission::kExtendedAccess, Permission::kListHelper, Permission::kListModerator,
                   Permission::kListAdministrator, Permission::kLeaderboardModerator, Permission::kModerator};
  }
  return assignable;
}

} // namespace demonlist::model
