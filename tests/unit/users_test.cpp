#include "internal/commands/users.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/context/precondition.hpp"
#include "internal/context/request_context.hpp"
#include "internal/patch/patch_field.hpp"
#include "internal/patch/user_patch.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"
#include "test_support.hpp"

namespace {

using demonlist::commands::BasicAuth;
using demonlist::commands::DeleteUserById;
using demonlist::commands::Invalidate;
using demonlist::commands::IssueToken;
using demonlist::commands::PatchCurrentUser;
using demonlist::commands::Register;
using demonlist::commands::TokenAuth;
using demonlist::commands::UserById;
using demonlist::commands::UserByName;
using demonlist::context::Etag;
using demonlist::context::Precondition;
using demonlist::context::RequestData;
using demonlist::model::Permission;
using demonlist::model::PermissionSet;
using demonlist::patch::PatchField;
using demonlist::patch::PatchMe;
using demonlist::testing::TestEnv;
using demonlist::testing::Throws;
namespace util = demonlist::util;

constexpr const char* kPassword = "hunter2hunter2";

void TestRegisterValidation() {
  TestEnv env;

  assert(Throws<util::InvalidUsername>([&] { env.executor.Execute(Register{"ab", kPassword}); }));
  assert(Throws<util::InvalidUsername>([&] { env.executor.Execute(Register{" padded", kPassword}); }));
  assert(Throws<util::InvalidPassword>([&] { env.executor.Execute(Register{"shortpass", "123456789"}); }));

  const auto user = env.executor.Execute(Register{"newbie", kPassword});
  assert(user.id > 0);
  assert(user.permissions.Empty());
  assert(user.password_hash != kPassword);

  assert(Throws<util::NameTaken>([&] { env.executor.Execute(Register{"newbie", "another password"}); }));

  assert(env.executor.Execute(UserByName{"newbie"}).id == user.id);
  assert(env.executor.Execute(UserById{user.id}).name == "newbie");
  assert(Throws<util::ModelNotFound>([&] { env.executor.Execute(UserById{user.id + 1}); }));
}

void TestBasicAuth() {
  TestEnv    env;
  const auto user = env.executor.Execute(Register{"basic", kPassword});

  assert(env.executor.Execute(BasicAuth{"basic", kPassword}).id == user.id);
  assert(Throws<util::Unauthorized>([&] { env.executor.Execute(BasicAuth{"basic", "wrong password"}); }));
  assert(Throws<util::Unauthorized>([&] { env.executor.Execute(BasicAuth{"nobody", kPassword}); }));
}

void TestTokenAuth() {
  TestEnv    env;
  const auto user  = env.executor.Execute(Register{"tokens", kPassword});
  const auto token = env.executor.Execute(IssueToken{user});

  assert(env.executor.Execute(TokenAuth{token}).id == user.id);

  assert(Throws<util::Unauthorized>([&] { env.executor.Execute(TokenAuth{"garbage"}); }));
  assert(Throws<util::Unauthorized>([&] { env.executor.Execute(TokenAuth{"999." + token.substr(token.find('.') + 1)}); }));
  assert(Throws<util::Unauthorized>([&] { env.executor.Execute(TokenAuth{token + "0"}); }));
}

void TestInvalidateRotatesTokens() {
  TestEnv    env;
  const auto user  = env.executor.Execute(Register{"rotator", kPassword});
  const auto token = env.executor.Execute(IssueToken{user});
  assert(env.executor.Execute(TokenAuth{token}).id == user.id);

  assert(Throws<util::Unauthorized>([&] { env.executor.Execute(Invalidate{"rotator", "wrong password"}); }));
  assert(env.executor.Execute(TokenAuth{token}).id == user.id);

  env.executor.Execute(Invalidate{"rotator", kPassword});
  assert(Throws<util::Unauthorized>([&] { env.executor.Execute(TokenAuth{token}); }));

  // the password itself still works and yields a fresh token
  const auto again = env.executor.Execute(BasicAuth{"rotator", kPassword});
  assert(env.executor.Execute(TokenAuth{env.executor.Execute(IssueToken{again})}).id == user.id);
}

void TestPatchCurrentUser() {
  TestEnv    env;
  const auto user = env.executor.Execute(Register{"self", kPassword});
  const auto data = RequestData::External("192.0.2.20").WithUser(user).WithPrecondition(Precondition::Of({Etag(user)}));

  PatchMe profile;
  profile.display_name    = PatchField<std::string>::Of("  Self  ");
  profile.youtube_channel = PatchField<std::string>::Of("https://youtube.com/c/self");
  const auto patched      = env.executor.Execute(PatchCurrentUser{data, user, profile});
  assert(patched.display_name == std::string("Self"));
  assert(patched.youtube_channel == std::string("https://youtube.com/c/self"));
  assert(env.executor.Execute(UserById{user.id}).display_name == std::string("Self"));

  PatchMe bad_channel;
  bad_channel.youtube_channel = PatchField<std::string>::Of("http://youtube.com/c/self");
  assert(Throws<util::InvalidField>([&] { env.executor.Execute(PatchCurrentUser{RequestData::Internal(), patched, bad_channel}); }));

  PatchMe short_password;
  short_password.password = PatchField<std::string>::Of("short");
  assert(Throws<util::InvalidPassword>([&] { env.executor.Execute(PatchCurrentUser{RequestData::Internal(), patched, short_password}); }));

  // the tag was computed before the profile changed
  PatchMe clear;
  clear.display_name = PatchField<std::string>::Null();
  assert(Throws<util::PreconditionFailed>([&] { env.executor.Execute(PatchCurrentUser{data, patched, clear}); }));

  const auto cleared = env.executor.Execute(PatchCurrentUser{RequestData::Internal(), patched, clear});
  assert(!cleared.display_name.has_value());
}

void TestDeleteUser() {
  TestEnv    env;
  const auto victim    = env.executor.Execute(Register{"victim", kPassword});
  const auto moderator = env.AddUser("moderator", PermissionSet{Permission::kModerator});
  const auto admin     = env.AddUser("admin", PermissionSet{Permission::kAdministrator});

  const auto external = RequestData::External("192.0.2.21");
  assert(Throws<util::Unauthorized>([&] { env.executor.Execute(DeleteUserById{external, victim.id}); }));
  assert(Throws<util::MissingPermissions>([&] { env.executor.Execute(DeleteUserById{external.WithUser(moderator), victim.id}); }));

  env.executor.Execute(DeleteUserById{external.WithUser(admin), victim.id});
  assert(Throws<util::ModelNotFound>([&] { env.executor.Execute(UserById{victim.id}); }));
  assert(Throws<util::ModelNotFound>([&] { env.executor.Execute(DeleteUserById{RequestData::Internal(), victim.id}); }));
}

void TestHashPrimitives() {
  assert(util::Sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  assert(util::ConstantTimeEquals("same", "same"));
  assert(!util::ConstantTimeEquals("same", "diff"));
  assert(!util::ConstantTimeEquals("short", "longer"));
  assert(util::RandomHex(8).size() == 16);
  assert(util::RandomHex(8) != util::RandomHex(8));
}

} // namespace

int main() {
  TestRegisterValidation();
  TestBasicAuth();
  TestTokenAuth();
  TestInvalidateRotatesTokens();
  TestPatchCurrentUser();
  TestDeleteUser();
  TestHashPrimitives();

  std::cout << "demonlist_unit_users: pass\n";
  return 0;
}
