#include "demon_patch.hpp"

#include "internal/commands/lookups.hpp"
#include "internal/db/api/result.hpp"
#include "internal/video/video_validator.hpp"

namespace demonlist::patch {

using demonlist::model::Permission;
using demonlist::model::PermissionSet;

namespace {

std::int64_t ExistingPlayerId(executor::DatabaseExecutor& executor, const std::string& name) {
  auto player = executor.Repository().GetPlayerByName(executor.Connection(), name);
  if (!player) {
    throw util::ModelNotFound("Player", "name=" + name);
  }
  return player->id;
}

} // namespace

db::model::Demon PatchDemon::Load(executor::DatabaseExecutor& executor, const Key& key) {
  return executor.Execute(commands::DemonByName{key});
}

PermissionSet PatchDemon::RequiredPermissions() const {
  if (name.IsAbsent() && position.IsAbsent() && video.IsAbsent() && requirement.IsAbsent() && verifier.IsAbsent() &&
      publisher.IsAbsent()) {
    return {};
  }
  return {Permission::kListModerator, Permission::kListAdministrator};
}

void PatchDemon::ValidateAndApply(db::model::Demon& demon, const context::RequestContext& ctx, executor::DatabaseExecutor& executor) const {
  auto& repo = executor.Repository();
  auto& conn = ctx.Connection();

  if (name.IsPresent()) {
    auto value = Trimmed(name.Require("name"));
    if (value.empty()) {
      throw util::InvalidField("name", "must not be empty");
    }
    if (value != demon.name) {
      if (auto other = repo.GetDemonByName(conn, value)) {
        throw util::DemonExists(other->position);
      }
    }
    demon.name = value;
  }

  if (position.IsPresent()) {
    const int value   = position.Require("position");
    const int maximum = repo.MaxDemonPosition(conn);
    if (value < 1 || value > maximum) {
      throw util::InvalidPosition(maximum);
    }
    demon.position = value;
  }

  if (video.IsPresent()) {
    demon.video = video.IsNull() ? std::nullopt : std::optional<std::string>(executor.Services().video_validator->Validate(video.Value()));
  }

  if (requirement.IsPresent()) {
    const int value = requirement.Require("requirement");
    if (value < 0 || value > 100) {
      throw util::InvalidRequirement();
    }
    demon.requirement = value;
  }

  if (verifier.IsPresent()) {
    demon.verifier = ExistingPlayerId(executor, verifier.Require("verifier"));
  }

  if (publisher.IsPresent()) {
    demon.publisher = ExistingPlayerId(executor, publisher.Require("publisher"));
  }
}

void PatchDemon::Persist(const db::model::Demon& original, db::model::Demon& patched, db::Repository& repository,
                         db::Connection& connection) const {
  if (patched.position != original.position) {
    db::ThrowIfDbError(repository.MoveDemon(connection, original.name, patched.position), "move demon");
  }
  db::ThrowIfDbError(repository.UpdateDemon(connection, original.name, patched), "update demon");
}

} // namespace demonlist::patch
