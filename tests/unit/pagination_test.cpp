#include "internal/pagination/paginate.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/context/request_context.hpp"
#include "internal/pagination/navigation.hpp"
#include "internal/pagination/player_pagination.hpp"
#include "internal/pagination/record_pagination.hpp"
#include "internal/pagination/user_pagination.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/url.hpp"
#include "test_support.hpp"

namespace {

using demonlist::context::RequestData;
using demonlist::model::Permission;
using demonlist::model::PermissionSet;
using demonlist::model::RecordStatus;
using demonlist::pagination::Navigation;
using demonlist::pagination::Paginate;
using demonlist::pagination::PlayerPagination;
using demonlist::pagination::RecordPagination;
using demonlist::pagination::UserPagination;
using demonlist::testing::TestEnv;
using demonlist::testing::Throws;
namespace util = demonlist::util;

std::vector<std::int64_t> Ids(const std::vector<demonlist::db::model::Player>& players) {
  std::vector<std::int64_t> ids;
  for (const auto& player : players) ids.push_back(player.id);
  return ids;
}

// players 1..5, default page size 2 (see TestEnv)
void SeedPlayers(TestEnv& env) {
  for (int i = 1; i <= 5; ++i) env.AddPlayer("player " + std::to_string(i), i % 2 == 0);
}

PlayerPagination Window(std::optional<std::int64_t> after, std::optional<std::int64_t> before) {
  PlayerPagination p;
  p.after  = after;
  p.before = before;
  return p;
}

void TestFirstPage() {
  TestEnv env;
  SeedPlayers(env);

  const auto page = env.executor.Execute(Paginate<PlayerPagination>{RequestData::Internal(), PlayerPagination{}});
  assert((Ids(page.items) == std::vector<std::int64_t>{1, 2}));
  assert(page.navigation.first == std::string("limit=2&after=0"));
  assert(page.navigation.last == std::string("limit=2&before=6"));
  assert(page.navigation.next == std::string("limit=2&after=2"));
  assert(!page.navigation.prev.has_value());
}

void TestMiddleAndLastPages() {
  TestEnv env;
  SeedPlayers(env);

  const auto middle = env.executor.Execute(Paginate<PlayerPagination>{RequestData::Internal(), Window(2, std::nullopt)});
  assert((Ids(middle.items) == std::vector<std::int64_t>{3, 4}));
  assert(middle.navigation.next == std::string("limit=2&after=4"));
  assert(middle.navigation.prev == std::string("limit=2&before=3"));

  const auto tail = env.executor.Execute(Paginate<PlayerPagination>{RequestData::Internal(), Window(4, std::nullopt)});
  assert((Ids(tail.items) == std::vector<std::int64_t>{5}));
  assert(!tail.navigation.next.has_value());
  assert(tail.navigation.prev == std::string("limit=2&before=5"));
}

void TestBeforeOnlyHugsTheCursor() {
  TestEnv env;
  SeedPlayers(env);

  const auto page = env.executor.Execute(Paginate<PlayerPagination>{RequestData::Internal(), Window(std::nullopt, 5)});
  assert((Ids(page.items) == std::vector<std::int64_t>{3, 4}));
  assert(page.navigation.prev == std::string("limit=2&before=3"));
  assert(page.navigation.next == std::string("limit=2&after=4"));

  auto bounded  = Window(1, 5);
  bounded.limit = 10;
  const auto both = env.executor.Execute(Paginate<PlayerPagination>{RequestData::Internal(), bounded});
  assert((Ids(both.items) == std::vector<std::int64_t>{2, 3, 4}));
}

void TestFiltersAreCarriedIntoLinks() {
  TestEnv env;
  SeedPlayers(env);

  PlayerPagination banned;
  banned.banned = true;
  banned.limit  = 1;
  const auto page = env.executor.Execute(Paginate<PlayerPagination>{RequestData::External("192.0.2.1"), banned});
  assert((Ids(page.items) == std::vector<std::int64_t>{2}));
  assert(page.navigation.first == std::string("banned=true&limit=1&after=1"));
  assert(page.navigation.next == std::string("banned=true&limit=1&after=2"));
  assert(page.navigation.last == std::string("banned=true&limit=1&before=5"));
  assert(!page.navigation.prev.has_value());

  assert(page.navigation.ToLinkHeader() ==
         "<banned=true&limit=1&after=1>; rel=first,<banned=true&limit=1&after=2>; rel=next,<banned=true&limit=1&before=5>; rel=last");
}

void TestEmptyResultSet() {
  TestEnv env;
  SeedPlayers(env);

  PlayerPagination nobody;
  nobody.name = "nobody";
  const auto page = env.executor.Execute(Paginate<PlayerPagination>{RequestData::Internal(), nobody});
  assert(page.items.empty());
  assert(page.navigation.Empty());
  assert(page.navigation.ToLinkHeader().empty());

  TestEnv    empty;
  const auto none = empty.executor.Execute(Paginate<PlayerPagination>{RequestData::Internal(), PlayerPagination{}});
  assert(none.items.empty());
  assert(none.navigation.Empty());
}

void TestLimitAndCursorValidation() {
  TestEnv env;
  SeedPlayers(env);

  auto zero  = PlayerPagination{};
  zero.limit = 0;
  assert(Throws<util::InvalidField>([&] { env.executor.Execute(Paginate<PlayerPagination>{RequestData::Internal(), zero}); }));

  auto huge  = PlayerPagination{};
  huge.limit = 11;
  bool field = false;
  try {
    env.executor.Execute(Paginate<PlayerPagination>{RequestData::Internal(), huge});
  } catch (const util::InvalidField& e) {
    field = e.Field() == "limit";
  }
  assert(field);

  assert(Throws<util::InvalidField>([&] { env.executor.Execute(Paginate<PlayerPagination>{RequestData::Internal(), Window(4, 4)}); }));
}

void TestRecordListingPermissions() {
  TestEnv env;
  env.AddDemon("main", 1);
  const auto player    = env.AddPlayer("player");
  const auto submitter = env.AddSubmitter("192.0.2.50");
  env.AddRecord(player.id, "main", 60, RecordStatus::kApproved, submitter.id);
  env.AddRecord(player.id, "main", 70, RecordStatus::kSubmitted, submitter.id);

  const auto anonymous = RequestData::External("192.0.2.2");

  RecordPagination approved;
  approved.status   = RecordStatus::kApproved;
  const auto public_page = env.executor.Execute(Paginate<RecordPagination>{anonymous, approved});
  assert(public_page.items.size() == 1);
  assert(public_page.navigation.first == std::string("status=approved&limit=2&after=0"));

  assert(Throws<util::Unauthorized>([&] { env.executor.Execute(Paginate<RecordPagination>{anonymous, RecordPagination{}}); }));

  const auto helper = env.AddUser("helper", PermissionSet{Permission::kListHelper});
  const auto all    = env.executor.Execute(Paginate<RecordPagination>{anonymous.WithUser(helper), RecordPagination{}});
  assert(all.items.size() == 2);

  RecordPagination by_demon;
  by_demon.demon  = "main";
  by_demon.player = player.id;
  by_demon.status = RecordStatus::kSubmitted;
  const auto filtered = env.executor.Execute(Paginate<RecordPagination>{RequestData::Internal(), by_demon});
  assert(filtered.items.size() == 1);
  assert(filtered.items.front().progress == 70);
}

void TestAuthorizationPrecedesValidation() {
  TestEnv    env;
  const auto anonymous = RequestData::External("192.0.2.4");

  RecordPagination zero;
  zero.limit = 0;
  assert(Throws<util::Unauthorized>([&] { env.executor.Execute(Paginate<RecordPagination>{anonymous, zero}); }));

  RecordPagination crossed;
  crossed.after  = 9;
  crossed.before = 3;
  assert(Throws<util::Unauthorized>([&] { env.executor.Execute(Paginate<RecordPagination>{anonymous, crossed}); }));

  const auto     player = env.AddUser("player", PermissionSet{Permission::kExtendedAccess});
  UserPagination users;
  users.limit = 0;
  assert(Throws<util::MissingPermissions>([&] { env.executor.Execute(Paginate<UserPagination>{anonymous.WithUser(player), users}); }));

  // public listings still validate
  PlayerPagination players;
  players.limit = 0;
  assert(Throws<util::InvalidField>([&] { env.executor.Execute(Paginate<PlayerPagination>{anonymous, players}); }));
}

void TestUserListingPermissions() {
  TestEnv    env;
  const auto moderator = env.AddUser("moderator", PermissionSet{Permission::kModerator});
  env.AddUser("helper", PermissionSet{Permission::kListHelper});
  env.AddUser("plain", PermissionSet{});

  const auto anonymous = RequestData::External("192.0.2.3");
  assert(Throws<util::Unauthorized>([&] { env.executor.Execute(Paginate<UserPagination>{anonymous, UserPagination{}}); }));

  UserPagination team;
  team.has   = demonlist::model::ListTeam();
  team.limit = 10;
  const auto page = env.executor.Execute(Paginate<UserPagination>{anonymous.WithUser(moderator), team});
  assert(page.items.size() == 1);
  assert(page.items.front().name == "helper");
}

void TestQueryStringEncoding() {
  util::QueryString query;
  query.Add("name", "a b&c").Add("limit", 5LL);
  assert(query.ToString() == "name=a%20b%26c&limit=5");

  Navigation navigation;
  navigation.prev = "before=3";
  assert(navigation.ToLinkHeader() == "<before=3>; rel=prev");
}

} // namespace

int main() {
  TestFirstPage();
  TestMiddleAndLastPages();
  TestBeforeOnlyHugsTheCursor();
  TestFiltersAreCarriedIntoLinks();
  TestEmptyResultSet();
  TestLimitAndCursorValidation();
  TestRecordListingPermissions();
  TestAuthorizationPrecedesValidation();
  TestUserListingPermissions();
  TestQueryStringEncoding();

  std::cout << "demonlist_unit_pagination: pass\n";
  return 0;
}
