#pragma once

#include "internal/context/request_context.hpp"
#include "internal/db/api/connection.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/executor/database_executor.hpp"
#include "internal/model/permissions.hpp"

namespace demonlist::patch {

/*
  Partial update of one entity type.

  RequiredPermissions() is the union of what the present fields need.
  ValidateAndApply() checks each present field against the current store
  and writes it onto the caller's copy. It only reads storage, so a
  rejected patch leaves no rows behind.
  Persist() writes the patched entity inside the transaction opened by
  ApplyPatch(), creating any rows it references first and recording
  their generated ids on `patched`.
*/
template <typename Entity>
class PatchOperation {
 public:
  using EntityType = Entity;

  virtual ~PatchOperation() = default;

  virtual model::PermissionSet RequiredPermissions() const = 0;

  virtual void ValidateAndApply(Entity& entity, const context::RequestContext& ctx, executor::DatabaseExecutor& executor) const = 0;

  virtual void Persist(const Entity& original, Entity& patched, db::Repository& repository, db::Connection& connection) const = 0;
};

/*
  authorize -> precondition -> validate + apply on a copy -> persist

  Authorization and precondition failures leave storage untouched and
  open no transaction. A successful patch commits exactly one transaction.
*/
template <typename Entity>
Entity ApplyPatch(const Entity& target, const PatchOperation<Entity>& patch, const context::RequestContext& ctx,
                  executor::DatabaseExecutor& executor) {
  ctx.CheckPermissions(patch.RequiredPermissions());
  ctx.CheckPrecondition(target);

  Entity patched = target;
  patch.ValidateAndApply(patched, ctx, executor);

  auto tx = ctx.Connection().Begin();
  patch.Persist(target, patched, executor.Repository(), ctx.Connection());
  tx->Commit();

  return patched;
}

/*
  Generic patch command. The target is loaded by key on the worker so the
  precondition is compared against the stored state.

  P provides: Key, static Load(executor, key), static constexpr kName.
*/
template <typename P>
struct Patch {
  using Result = typename P::EntityType;

  static constexpr const char* kName = P::kName;

  context::RequestData request;
  typename P::Key      key;
  P                    patch;

  Result Handle(executor::DatabaseExecutor& executor) const {
    auto target = P::Load(executor, key);
    auto ctx    = request.Context(executor.Connection());
    return ApplyPatch<Result>(target, patch, ctx, executor);
  }
};

} // namespace demonlist::patch
