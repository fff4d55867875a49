#include "internal/context/request_context.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/context/precondition.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/model/permissions.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using demonlist::context::Etag;
using demonlist::context::Precondition;
using demonlist::context::RequestData;
using demonlist::db::memory::MemoryRepository;
using demonlist::model::Permission;
using demonlist::model::PermissionSet;
using demonlist::testing::Throws;
namespace util = demonlist::util;
namespace dbm  = demonlist::db::model;

dbm::User UserWith(PermissionSet permissions) {
  dbm::User user;
  user.id            = 7;
  user.name          = "moderator";
  user.password_hash = "secret";
  user.permissions   = permissions;
  return user;
}

void TestPermissionSetIsAnyOf() {
  const PermissionSet granted{Permission::kListHelper};

  assert(granted.Intersects(PermissionSet{Permission::kListHelper, Permission::kAdministrator}));
  assert(!granted.Intersects(PermissionSet{Permission::kModerator}));
  assert(!granted.Intersects(PermissionSet{}));
  assert(demonlist::model::ListTeam().Contains(Permission::kListAdministrator));
  assert(PermissionSet::FromBits(granted.Bits()) == granted);
  assert((PermissionSet{Permission::kListHelper, Permission::kModerator}.ToString() == "ListHelper,Moderator"));
}

void TestAssignablePermissions() {
  const auto list_admin = demonlist::model::AssignableBy(PermissionSet{Permission::kListAdministrator});
  assert(list_admin.Contains(Permission::kListModerator));
  assert(!list_admin.Contains(Permission::kListAdministrator));
  assert(!list_admin.Contains(Permission::kAdministrator));

  const auto admin = demonlist::model::AssignableBy(PermissionSet{Permission::kAdministrator});
  assert(admin.Contains(Permission::kListAdministrator));
  assert(!admin.Contains(Permission::kAdministrator));

  assert(demonlist::model::AssignableBy(PermissionSet{}).Empty());
}

void TestInternalContextPassesEverything() {
  MemoryRepository repo;
  auto             conn = repo.Acquire();
  const auto       data = RequestData::Internal();
  const auto       ctx  = data.Context(*conn);

  assert(ctx.IsInternal());
  assert(ctx.IsListModerator());
  assert(ctx.User() == nullptr);
  ctx.CheckPermissions(PermissionSet{Permission::kAdministrator});

  dbm::Player player;
  player.id   = 1;
  player.name = "anyone";
  ctx.CheckPrecondition(player);
}

void TestExternalPermissionChecks() {
  MemoryRepository repo;
  auto             conn = repo.Acquire();

  const auto anonymous = RequestData::External("10.0.0.1");
  const auto anon_ctx  = anonymous.Context(*conn);
  anon_ctx.CheckPermissions(PermissionSet{});
  assert(Throws<util::Unauthorized>([&] { anon_ctx.CheckPermissions(PermissionSet{Permission::kListHelper}); }));
  assert(!anon_ctx.IsListModerator());
  assert(anon_ctx.Ip() == "10.0.0.1");

  const auto helper     = anonymous.WithUser(UserWith(PermissionSet{Permission::kListHelper}));
  const auto helper_ctx = helper.Context(*conn);
  helper_ctx.CheckPermissions(PermissionSet{Permission::kListHelper, Permission::kListModerator});
  assert(helper_ctx.IsListModerator());
  assert(helper_ctx.User() != nullptr && helper_ctx.User()->id == 7);

  bool missing = false;
  try {
    helper_ctx.CheckPermissions(PermissionSet{Permission::kAdministrator});
  } catch (const util::MissingPermissions& e) {
    missing = e.Required() == PermissionSet{Permission::kAdministrator};
    assert(e.Status() == 403);
  }
  assert(missing);

  const auto extended = anonymous.WithUser(UserWith(PermissionSet{Permission::kExtendedAccess}));
  assert(!extended.Context(*conn).IsListModerator());
}

void TestPreconditionChecks() {
  MemoryRepository repo;
  auto             conn = repo.Acquire();

  dbm::Player player;
  player.id   = 3;
  player.name = "stardust";

  const auto base = RequestData::External("10.0.0.2");
  assert(Throws<util::InvalidState>([&] { base.Context(*conn).CheckPrecondition(player); }));

  const auto matching = base.WithPrecondition(Precondition::Of({Etag(player)}));
  matching.Context(*conn).CheckPrecondition(player);

  const auto wildcard = base.WithPrecondition(Precondition::Any());
  wildcard.Context(*conn).CheckPrecondition(player);

  auto renamed = player;
  renamed.name = "stardust1973";
  assert(Throws<util::PreconditionFailed>([&] { matching.Context(*conn).CheckPrecondition(renamed); }));
}

void TestPreconditionParsing() {
  const auto any = Precondition::Parse(" * ");
  assert(any.IsWildcard());
  assert(any.Met("whatever"));

  const auto listed = Precondition::Parse(R"(W/"abc", "def",ghi)");
  assert(!listed.IsWildcard());
  assert(listed.Tags().size() == 3);
  assert(listed.Met("abc"));
  assert(listed.Met("def"));
  assert(listed.Met("ghi"));
  assert(!listed.Met("xyz"));

  assert(Precondition::Parse("").Tags().empty());
}

void TestEntityTags() {
  dbm::Demon demon;
  demon.name        = "Bloodbath";
  demon.position    = 1;
  demon.requirement = 60;
  demon.verifier    = 2;
  demon.publisher   = 3;

  const auto tag = Etag(demon);
  assert(tag.size() == 64);
  assert(Etag(demon) == tag);

  auto moved     = demon;
  moved.position = 2;
  assert(Etag(moved) != tag);

  auto with_video  = demon;
  with_video.video = std::string("https://youtu.be/abc");
  assert(Etag(with_video) != tag);

  auto       user    = UserWith(PermissionSet{Permission::kModerator});
  const auto user_tag = Etag(user);
  user.password_hash = "rotated";
  assert(Etag(user) == user_tag);
  user.display_name = std::string("Mod");
  assert(Etag(user) != user_tag);

  dbm::Player a;
  a.name = "ab";
  dbm::Player b;
  b.name = "a";
  assert(Etag(a) != Etag(b));
}

} // namespace

int main() {
  TestPermissionSetIsAnyOf();
  TestAssignablePermissions();
  TestInternalContextPassesEverything();
  TestExternalPermissionChecks();
  TestPreconditionChecks();
  TestPreconditionParsing();
  TestEntityTags();

  std::cout << "demonlist_unit_request_context: pass\n";
  return 0;
}
