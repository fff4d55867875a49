#include "lookups.hpp"

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace demonlist::commands {

using demonlist::model::Permission;
using demonlist::model::PermissionSet;

db::model::Submitter SubmitterByIp::Handle(DatabaseExecutor& executor) const {
  auto& repo = executor.Repository();
  auto& conn = executor.Connection();

  if (auto existing = repo.GetSubmitterByIp(conn, ip)) {
    return *existing;
  }

  db::model::Submitter submitter;
  submitter.ip = ip;
  auto result  = repo.InsertSubmitter(conn, submitter);
  if (result.code == db::ErrorCode::AlreadyExists) {
    // inserted concurrently by another worker
    if (auto existing = repo.GetSubmitterByIp(conn, ip)) return *existing;
  }
  db::ThrowIfDbError(result, "insert submitter");
  return submitter;
}

db::model::Player PlayerByName::Handle(DatabaseExecutor& executor) const {
  auto& repo = executor.Repository();
  auto& conn = executor.Connection();

  if (auto existing = repo.GetPlayerByName(conn, name)) {
    return *existing;
  }

  db::model::Player player;
  player.name = name;
  auto result = repo.InsertPlayer(conn, player);
  if (result.code == db::ErrorCode::AlreadyExists) {
    if (auto existing = repo.GetPlayerByName(conn, name)) return *existing;
  }
  db::ThrowIfDbError(result, "insert player");
  return player;
}

db::model::Player PlayerById::Handle(DatabaseExecutor& executor) const {
  auto player = executor.Repository().GetPlayerById(executor.Connection(), id);
  if (!player) {
    throw util::ModelNotFound("Player", "id=" + std::to_string(id));
  }
  return *player;
}

db::model::Demon DemonByName::Handle(DatabaseExecutor& executor) const {
  auto demon = executor.Repository().GetDemonByName(executor.Connection(), name);
  if (!demon) {
    throw util::ModelNotFound("Demon", "name=" + name);
  }
  return *demon;
}

db::model::Record RecordById::Handle(DatabaseExecutor& executor) const {
  auto record = executor.Repository().GetRecordById(executor.Connection(), id);
  if (!record) {
    throw util::ModelNotFound("Record", "id=" + std::to_string(id));
  }
  return *record;
}

void DeleteRecordById::Handle(DatabaseExecutor& executor) const {
  auto ctx = request.Context(executor.Connection());
  ctx.CheckPermissions(PermissionSet{Permission::kListModerator, Permission::kListAdministrator});

  auto result = executor.Repository().DeleteRecord(ctx.Connection(), id);
  if (result.code == db::ErrorCode::NotFound) {
    throw util::ModelNotFound("Record", "id=" + std::to_string(id));
  }
  db::ThrowIfDbError(result, "delete record");
}

} // namespace demonlist::commands
