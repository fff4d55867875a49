#pragma once

#include <string>

#include "internal/db/model/demon.hpp"
#include "internal/patch/patch.hpp"
#include "internal/patch/patch_field.hpp"

namespace demonlist::patch {

/*
  ListModerator or ListAdministrator for every field. A position change
  moves the demons in between by one step inside the same transaction.
*/
class PatchDemon final : public PatchOperation<db::model::Demon> {
 public:
  using Key                          = std::string;
  static constexpr const char* kName = "PatchDemon";

  PatchField<std::string> name;
  PatchField<int>         position;
  PatchField<std::string> video; // nullable
  PatchField<int>         requirement;
  PatchField<std::string> verifier;  // player name
  PatchField<std::string> publisher; // player name

  static db::model::Demon Load(executor::DatabaseExecutor& executor, const Key& key);

  model::PermissionSet RequiredPermissions() const override;

  void ValidateAndApply(db::model::Demon& demon, const context::RequestContext& ctx, executor::DatabaseExecutor& executor) const override;

  void Persist(const db::model::Demon& original, db::model::Demon& patched, db::Repository& repository,
               db::Connection& connection) const override;
};

} // namespace demonlist::patch
