#pragma once

#include <cstdint>
#include <string>

#include "internal/db/model/record.hpp"
#include "internal/model/record_status.hpp"
#include "internal/patch/patch.hpp"
#include "internal/patch/patch_field.hpp"

namespace demonlist::patch {

/*
  progress, video and status are open to the whole list team; moving a
  record to another player or demon needs ListModerator or
  ListAdministrator. Unknown player names are created, unknown demons
  are an error. Progress is checked against the requirement of the
  demon the record ends up on.
*/
class PatchRecord final : public PatchOperation<db::model::Record> {
 public:
  using Key                          = std::int64_t;
  static constexpr const char* kName = "PatchRecord";

  PatchField<int>                  progress;
  PatchField<std::string>          video; // nullable
  PatchField<model::RecordStatus>  status;
  PatchField<std::string>          player; // player name
  PatchField<std::string>          demon;  // demon name

  static db::model::Record Load(executor::DatabaseExecutor& executor, const Key& key);

  model::PermissionSet RequiredPermissions() const override;

  void ValidateAndApply(db::model::Record& record, const context::RequestContext& ctx, executor::DatabaseExecutor& executor) const override;

  void Persist(const db::model::Record& original, db::model::Record& patched, db::Repository& repository,
               db::Connection& connection) const override;
};

} // namespace demonlist::patch
