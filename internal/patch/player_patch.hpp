#pragma once

#include <cstdint>
#include <string>

#include "internal/db/model/player.hpp"
#include "internal/patch/patch.hpp"
#include "internal/patch/patch_field.hpp"

namespace demonlist::patch {

/*
  Banning a player deletes its Submitted records and rejects every other
  record it holds, in the patch transaction.
*/
class PatchPlayer final : public PatchOperation<db::model::Player> {
 public:
  using Key                          = std::int64_t;
  static constexpr const char* kName = "PatchPlayer";

  PatchField<std::string> name;
  PatchField<bool>        banned;

  static db::model::Player Load(executor::DatabaseExecutor& executor, const Key& key);

  model::PermissionSet RequiredPermissions() const override;

  void ValidateAndApply(db::model::Player& player, const context::RequestContext& ctx, executor::DatabaseExecutor& executor) const override;

  void Persist(const db::model::Player& original, db::model::Player& patched, db::Repository& repository,
               db::Connection& connection) const override;
};

} // namespace demonlist::patch
