#include "player_patch.hpp"

#include "internal/commands/lookups.hpp"
#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"

namespace demonlist::patch {

using demonlist::model::Permission;
using demonlist::model::PermissionSet;

db::model::Player PatchPlayer::Load(executor::DatabaseExecutor& executor, const Key& key) {
  return executor.Execute(commands::PlayerById{key});
}

PermissionSet PatchPlayer::RequiredPermissions() const {
  if (name.IsAbsent() && banned.IsAbsent()) return {};
  return {Permission::kListModerator, Permission::kListAdministrator};
}

void PatchPlayer::ValidateAndApply(db::model::Player& player, const context::RequestContext& ctx, executor::DatabaseExecutor& executor) const {
  if (name.IsPresent()) {
    auto value = Trimmed(name.Require("name"));
    if (value.empty()) {
      throw util::InvalidField("name", "must not be empty");
    }
    if (value != player.name) {
      auto other = executor.Repository().GetPlayerByName(ctx.Connection(), value);
      if (other && other->id != player.id) {
        throw util::NameTaken();
      }
    }
    player.name = value;
  }

  if (banned.IsPresent()) {
    player.banned = banned.Require("banned");
  }
}

void PatchPlayer::Persist(const db::model::Player& original, db::model::Player& patched, db::Repository& repository,
                          db::Connection& connection) const {
  auto result = repository.UpdatePlayer(connection, patched);
  if (result.code == db::ErrorCode::AlreadyExists) {
    throw util::NameTaken();
  }
  db::ThrowIfDbError(result, "update player");

  if (patched.banned && !original.banned) {
    db::ThrowIfDbError(repository.PurgeRecordsOfPlayer(connection, patched.id), "purge records of banned player");
    DEMONLIST_LOG_INFO("player banned", {observability::IntField("player", patched.id)});
  }
}

} // namespace demonlist::patch
