#include "users.hpp"

#include "internal/auth/credentials.hpp"
#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"
#include "internal/patch/patch.hpp"
#include "internal/patch/patch_field.hpp"
#include "internal/util/errors.hpp"

namespace demonlist::commands {

using demonlist::model::Permission;
using demonlist::model::PermissionSet;

namespace {

constexpr std::size_t kMinNameLength     = 3;
constexpr std::size_t kMinPasswordLength = 10;

} // namespace

db::model::User Register::Handle(DatabaseExecutor& executor) const {
  if (name.size() < kMinNameLength || patch::Trimmed(name) != name) {
    throw util::InvalidUsername();
  }
  if (password.size() < kMinPasswordLength) {
    throw util::InvalidPassword();
  }

  auto& repo = executor.Repository();
  auto& conn = executor.Connection();

  if (repo.GetUserByName(conn, name)) {
    throw util::NameTaken();
  }

  db::model::User user;
  user.name          = name;
  user.password_hash = executor.Services().password_hasher->Hash(password);

  auto result = repo.InsertUser(conn, user);
  if (result.code == db::ErrorCode::AlreadyExists) {
    throw util::NameTaken();
  }
  db::ThrowIfDbError(result, "insert user");

  DEMONLIST_LOG_INFO("user registered", {observability::IntField("user", user.id), observability::StringField("name", user.name)});
  return user;
}

db::model::User UserById::Handle(DatabaseExecutor& executor) const {
  auto user = executor.Repository().GetUserById(executor.Connection(), id);
  if (!user) {
    throw util::ModelNotFound("User", "id=" + std::to_string(id));
  }
  return *user;
}

db::model::User UserByName::Handle(DatabaseExecutor& executor) const {
  auto user = executor.Repository().GetUserByName(executor.Connection(), name);
  if (!user) {
    throw util::ModelNotFound("User", "name=" + name);
  }
  return *user;
}

void DeleteUserById::Handle(DatabaseExecutor& executor) const {
  auto ctx = request.Context(executor.Connection());
  ctx.CheckPermissions(PermissionSet{Permission::kAdministrator});

  auto result = executor.Repository().DeleteUser(ctx.Connection(), id);
  if (result.code == db::ErrorCode::NotFound) {
    throw util::ModelNotFound("User", "id=" + std::to_string(id));
  }
  db::ThrowIfDbError(result, "delete user");
}

db::model::User TokenAuth::Handle(DatabaseExecutor& executor) const {
  auto& codec = *executor.Services().token_codec;

  const auto id = codec.DecodeUnverifiedId(token);
  if (!id) {
    throw util::Unauthorized();
  }

  db::model::User user;
  try {
    user = executor.Execute(UserById{*id});
  } catch (const util::ModelNotFound&) {
    throw util::Unauthorized();
  }

  if (!codec.Verify(token, user)) {
    throw util::Unauthorized();
  }
  return user;
}

std::string IssueToken::Handle(DatabaseExecutor& executor) const {
  return executor.Services().token_codec->Issue(user);
}

db::model::User BasicAuth::Handle(DatabaseExecutor& executor) const {
  db::model::User user;
  try {
    user = executor.Execute(UserByName{username});
  } catch (const util::ModelNotFound&) {
    throw util::Unauthorized();
  }

  if (!executor.Services().password_hasher->Verify(password, user.password_hash)) {
    throw util::Unauthorized();
  }
  return user;
}

db::model::User PatchCurrentUser::Handle(DatabaseExecutor& executor) const {
  auto ctx = request.Context(executor.Connection());
  return patch::ApplyPatch<db::model::User>(user, patch, ctx, executor);
}

void Invalidate::Handle(DatabaseExecutor& executor) const {
  auto user = executor.Execute(BasicAuth{username, password});

  patch::PatchMe rotate;
  rotate.password = patch::PatchField<std::string>::Of(password);

  executor.Execute(PatchCurrentUser{context::RequestData::Internal(), std::move(user), rotate});
  DEMONLIST_LOG_INFO("credentials invalidated", {observability::StringField("name", username)});
}

} // namespace demonlist::commands
