#pragma once

#include <cstdint>
#include <string>

#include "internal/db/model/user.hpp"
#include "internal/model/permissions.hpp"
#include "internal/patch/patch.hpp"
#include "internal/patch/patch_field.hpp"

namespace demonlist::patch {

/*
  Staff-side edit of another account.

  display_name needs Moderator or Administrator, permissions needs
  ListAdministrator or Administrator. Every permission bit that changes
  must be one the acting user may assign.
*/
class PatchUser final : public PatchOperation<db::model::User> {
 public:
  using Key                          = std::int64_t;
  static constexpr const char* kName = "PatchUser";

  PatchField<std::string>          display_name; // nullable
  PatchField<model::PermissionSet> permissions;

  static db::model::User Load(executor::DatabaseExecutor& executor, const Key& key);

  model::PermissionSet RequiredPermissions() const override;

  void ValidateAndApply(db::model::User& user, const context::RequestContext& ctx, executor::DatabaseExecutor& executor) const override;

  void Persist(const db::model::User& original, db::model::User& patched, db::Repository& repository,
               db::Connection& connection) const override;
};

/*
  A user editing their own account. Needs no permissions.
*/
class PatchMe final : public PatchOperation<db::model::User> {
 public:
  static constexpr const char* kName = "PatchMe";

  PatchField<std::string> password;
  PatchField<std::string> display_name;    // nullable
  PatchField<std::string> youtube_channel; // nullable

  model::PermissionSet RequiredPermissions() const override;

  void ValidateAndApply(db::model::User& user, const context::RequestContext& ctx, executor::DatabaseExecutor& executor) const override;

  void Persist(const db::model::User& original, db::model::User& patched, db::Repository& repository,
               db::Connection& connection) const override;
};

// Trimmed, at least 3 characters. Throws InvalidField{display_name}.
std::string ValidateDisplayName(const std::string& value);

} // namespace demonlist::patch
