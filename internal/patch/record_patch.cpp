#include "record_patch.hpp"

#include "internal/commands/lookups.hpp"
#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"
#include "internal/video/video_validator.hpp"

namespace demonlist::patch {

using demonlist::model::Permission;
using demonlist::model::PermissionSet;

db::model::Record PatchRecord::Load(executor::DatabaseExecutor& executor, const Key& key) {
  return executor.Execute(commands::RecordById{key});
}

PermissionSet PatchRecord::RequiredPermissions() const {
  PermissionSet required;
  if (progress.IsPresent() || video.IsPresent() || status.IsPresent()) {
    required |= model::ListTeam();
  }
  if (player.IsPresent() || demon.IsPresent()) {
    required |= PermissionSet{Permission::kListModerator, Permission::kListAdministrator};
  }
  return required;
}

void PatchRecord::ValidateAndApply(db::model::Record& record, const context::RequestContext& ctx, executor::DatabaseExecutor& executor) const {
  if (demon.IsPresent()) {
    record.demon = executor.Execute(commands::DemonByName{demon.Require("demon")}).name;
  }

  if (video.IsPresent()) {
    record.video = video.IsNull() ? std::nullopt : std::optional<std::string>(executor.Services().video_validator->Validate(video.Value()));
  }

  if (status.IsPresent()) {
    record.status = status.Require("status");
  }

  if (progress.IsPresent() || demon.IsPresent()) {
    const int  value       = progress.IsPresent() ? progress.Require("progress") : record.progress;
    const auto requirement = executor.Execute(commands::DemonByName{record.demon}).requirement;
    if (value < requirement || value > 100) {
      throw util::InvalidProgress(requirement);
    }
    record.progress = value;
  }

  // unknown players are created by Persist(); 0 marks the pending insert
  if (player.IsPresent()) {
    const auto name = Trimmed(player.Require("player"));
    if (name.empty()) {
      throw util::InvalidField("player", "must not be empty");
    }
    const auto existing = executor.Repository().GetPlayerByName(ctx.Connection(), name);
    record.player       = existing ? existing->id : 0;
  }
}

void PatchRecord::Persist(const db::model::Record&, db::model::Record& patched, db::Repository& repository,
                          db::Connection& connection) const {
  if (player.IsPresent() && patched.player == 0) {
    db::model::Player created;
    created.name = Trimmed(player.Value());
    db::ThrowIfDbError(repository.InsertPlayer(connection, created), "insert player");
    patched.player = created.id;
  }
  db::ThrowIfDbError(repository.UpdateRecord(connection, patched), "update record");
}

} // namespace demonlist::patch
