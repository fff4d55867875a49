#include "user_patch.hpp"

#include "internal/auth/credentials.hpp"
#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"

namespace demonlist::patch {

using demonlist::model::Permission;
using demonlist::model::PermissionSet;

namespace {

constexpr std::size_t kMinPasswordLength = 10;

db::model::User LoadUser(executor::DatabaseExecutor& executor, std::int64_t id) {
  auto user = executor.Repository().GetUserById(executor.Connection(), id);
  if (!user) {
    throw util::ModelNotFound("User", "id=" + std::to_string(id));
  }
  return *user;
}

void PersistUser(const db::model::User& patched, db::Repository& repository, db::Connection& connection) {
  db::ThrowIfDbError(repository.UpdateUser(connection, patched), "update user");
}

} // namespace

std::string ValidateDisplayName(const std::string& value) {
  auto trimmed = Trimmed(value);
  if (trimmed.size() < 3) {
    throw util::InvalidField("display_name", "must be at least 3 characters long");
  }
  return trimmed;
}

// ------------------------------------------------------------------
// PatchUser
// ------------------------------------------------------------------

db::model::User PatchUser::Load(executor::DatabaseExecutor& executor, const Key& key) {
  return LoadUser(executor, key);
}

PermissionSet PatchUser::RequiredPermissions() const {
  PermissionSet required;
  if (display_name.IsPresent()) {
    required |= PermissionSet{Permission::kModerator, Permission::kAdministrator};
  }
  if (permissions.IsPresent()) {
    required |= PermissionSet{Permission::kListAdministrator, Permission::kAdministrator};
  }
  return required;
}

void PatchUser::ValidateAndApply(db::model::User& user, const context::RequestContext& ctx, executor::DatabaseExecutor&) const {
  if (display_name.IsPresent()) {
    user.display_name = display_name.IsNull() ? std::nullopt : std::optional<std::string>(ValidateDisplayName(display_name.Value()));
  }

  if (permissions.IsPresent()) {
    const auto& granted = permissions.Require("permissions");

    // internal requests may assign anything
    if (const auto* actor = ctx.User()) {
      const auto changed        = user.permissions ^ granted;
      const auto non_assignable = changed ^ (changed & model::AssignableBy(actor->permissions));
      if (!non_assignable.Empty()) {
        throw util::PermissionNotAssignable(non_assignable);
      }
    }
    user.permissions = granted;
  }
}

void PatchUser::Persist(const db::model::User& original, db::model::User& patched, db::Repository& repository,
                        db::Connection& connection) const {
  PersistUser(patched, repository, connection);
  if (original.permissions != patched.permissions) {
    DEMONLIST_LOG_INFO("user permissions changed", {observability::IntField("user", patched.id),
                                                    observability::StringField("from", original.permissions.ToString()),
                                                    observability::StringField("to", patched.permissions.ToString())});
  }
}

// ------------------------------------------------------------------
// PatchMe
// ------------------------------------------------------------------

PermissionSet PatchMe::RequiredPermissions() const {
  return {};
}

void PatchMe::ValidateAndApply(db::model::User& user, const context::RequestContext&, executor::DatabaseExecutor& executor) const {
  if (password.IsPresent()) {
    const auto& value = password.Require("password");
    if (value.size() < kMinPasswordLength) {
      throw util::InvalidPassword();
    }
    user.password_hash = executor.Services().password_hasher->Hash(value);
  }

  if (display_name.IsPresent()) {
    user.display_name = display_name.IsNull() ? std::nullopt : std::optional<std::string>(ValidateDisplayName(display_name.Value()));
  }

  if (youtube_channel.IsPresent()) {
    if (youtube_channel.IsNull()) {
      user.youtube_channel.reset();
    } else {
      const auto& value = youtube_channel.Value();
      if (value.empty() || value.rfind("https://", 0) != 0) {
        throw util::InvalidField("youtube_channel", "must be an https URL");
      }
      user.youtube_channel = value;
    }
  }
}

void PatchMe::Persist(const db::model::User&, db::model::User& patched, db::Repository& repository, db::Connection& connection) const {
  PersistUser(patched, repository, connection);
}

} // namespace demonlist::patch
