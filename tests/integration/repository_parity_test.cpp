#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"

#if DEMONLIST_DB_POSTGRES
#include "internal/db/postgres/pg_tx.hpp"
#endif

namespace {

using demonlist::db::Connection;
using demonlist::db::ErrorCode;
using demonlist::db::Keyset;
using demonlist::db::PlayerFilter;
using demonlist::db::RecordFilter;
using demonlist::db::Repository;
using demonlist::db::UserFilter;
using demonlist::db::memory::MemoryRepository;
using demonlist::model::Permission;
using demonlist::model::PermissionSet;
using demonlist::model::RecordStatus;
using demonlist::runtime::config::RuntimeConfig;
namespace dbm = demonlist::db::model;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

dbm::Player InsertPlayer(Repository& repo, Connection& conn, const std::string& name, bool banned = false) {
  dbm::Player player{.id = 0, .name = name, .banned = banned};
  assert(repo.InsertPlayer(conn, player));
  assert(player.id != 0);
  return player;
}

void VerifyPlayers(Repository& repo) {
  auto conn = repo.Acquire();

  const auto alpha = InsertPlayer(repo, *conn, "alpha");
  const auto beta  = InsertPlayer(repo, *conn, "beta", true);
  const auto gamma = InsertPlayer(repo, *conn, "gamma");

  dbm::Player duplicate{.id = 0, .name = "alpha", .banned = false};
  assert(repo.InsertPlayer(*conn, duplicate).code == ErrorCode::AlreadyExists);

  auto by_name = repo.GetPlayerByName(*conn, "beta");
  assert(by_name.has_value());
  assert(by_name->id == beta.id);
  assert(by_name->banned);
  assert(repo.GetPlayerById(*conn, alpha.id)->name == "alpha");
  assert(!repo.GetPlayerByName(*conn, "nobody").has_value());

  auto renamed = alpha;
  renamed.name = "alpha prime";
  assert(repo.UpdatePlayer(*conn, renamed));
  assert(repo.GetPlayerById(*conn, alpha.id)->name == "alpha prime");

  auto clash = gamma;
  clash.name = "beta";
  assert(repo.UpdatePlayer(*conn, clash).code == ErrorCode::AlreadyExists);

  auto ghost = gamma;
  ghost.id   = gamma.id + 1000;
  assert(repo.UpdatePlayer(*conn, ghost).code == ErrorCode::NotFound);

  Keyset all;
  all.limit = 10;
  assert(repo.ListPlayers(*conn, PlayerFilter{}, all).size() == 3);

  PlayerFilter unbanned;
  unbanned.banned = false;
  const auto free = repo.ListPlayers(*conn, unbanned, all);
  assert(free.size() == 2);
  assert(free[0].id == alpha.id && free[1].id == gamma.id);

  Keyset top;
  top.limit      = 1;
  top.descending = true;
  const auto last = repo.ListPlayers(*conn, PlayerFilter{}, top);
  assert(last.size() == 1 && last[0].id == gamma.id);

  Keyset between;
  between.after  = alpha.id;
  between.before = gamma.id;
  between.limit  = 10;
  const auto middle = repo.ListPlayers(*conn, PlayerFilter{}, between);
  assert(middle.size() == 1 && middle[0].id == beta.id);
}

void VerifyDemonsAndRecords(Repository& repo) {
  auto conn = repo.Acquire();

  const auto verifier = InsertPlayer(repo, *conn, "verifier");
  const auto other    = InsertPlayer(repo, *conn, "other");

  for (int i = 1; i <= 3; ++i) {
    dbm::Demon demon{.name = "demon " + std::to_string(i), .position = i, .requirement = 50, .video = std::nullopt,
                     .verifier = verifier.id, .publisher = verifier.id};
    assert(repo.InsertDemon(*conn, demon));
  }
  dbm::Demon duplicate{.name = "demon 1", .position = 4, .requirement = 50, .video = std::nullopt, .verifier = verifier.id,
                       .publisher = verifier.id};
  assert(repo.InsertDemon(*conn, duplicate).code == ErrorCode::AlreadyExists);
  assert(repo.MaxDemonPosition(*conn) == 3);

  assert(repo.MoveDemon(*conn, "demon 3", 1));
  assert(repo.GetDemonByName(*conn, "demon 3")->position == 1);
  assert(repo.GetDemonByName(*conn, "demon 1")->position == 2);
  assert(repo.GetDemonByName(*conn, "demon 2")->position == 3);
  assert(repo.MoveDemon(*conn, "missing", 1).code == ErrorCode::NotFound);

  dbm::Submitter submitter{.id = 0, .ip = "198.51.100.77", .banned = false};
  assert(repo.InsertSubmitter(*conn, submitter));
  assert(repo.GetSubmitterByIp(*conn, "198.51.100.77")->id == submitter.id);
  submitter.banned = true;
  assert(repo.UpdateSubmitter(*conn, submitter));
  assert(repo.GetSubmitterById(*conn, submitter.id)->banned);

  const auto record = [&](std::int64_t player, int progress, RecordStatus status, std::optional<std::string> video) {
    dbm::Record r{.id = 0, .progress = progress, .video = std::move(video), .status = status, .player = player,
                  .submitter = submitter.id, .demon = "demon 1"};
    assert(repo.InsertRecord(*conn, r));
    return r;
  };

  const auto approved  = record(verifier.id, 50, RecordStatus::kApproved, std::nullopt);
  const auto submitted = record(verifier.id, 70, RecordStatus::kSubmitted, std::nullopt);
  const auto rejected  = record(other.id, 30, RecordStatus::kRejected, std::string("https://youtu.be/shared"));

  const auto matches = repo.FindMatchingRecords(*conn, verifier.id, "demon 1", std::string("https://youtu.be/shared"));
  assert(matches.size() == 3);
  assert(matches[0].id == rejected.id);
  assert(matches[1].id == submitted.id);
  assert(matches[2].id == approved.id);
  assert(repo.FindMatchingRecords(*conn, verifier.id, "demon 1", std::nullopt).size() == 2);

  // rename keeps the position and carries the records along
  auto renamed = *repo.GetDemonByName(*conn, "demon 1");
  renamed.name        = "Bloodbath";
  renamed.requirement = 60;
  renamed.video       = "https://youtu.be/bloodbath";
  assert(repo.UpdateDemon(*conn, "demon 1", renamed));
  assert(!repo.GetDemonByName(*conn, "demon 1").has_value());
  const auto stored = repo.GetDemonByName(*conn, "Bloodbath");
  assert(stored.has_value());
  assert(stored->position == 2);
  assert(stored->requirement == 60);
  assert(stored->video == std::string("https://youtu.be/bloodbath"));
  assert(repo.GetRecordById(*conn, approved.id)->demon == "Bloodbath");

  RecordFilter by_demon;
  by_demon.demon = "Bloodbath";
  Keyset all;
  all.limit = 10;
  assert(repo.ListRecords(*conn, by_demon, all).size() == 3);

  RecordFilter by_status;
  by_status.status = RecordStatus::kSubmitted;
  by_status.player = verifier.id;
  const auto pending = repo.ListRecords(*conn, by_status, all);
  assert(pending.size() == 1 && pending[0].id == submitted.id);

  auto regraded     = *repo.GetRecordById(*conn, rejected.id);
  regraded.progress = 40;
  assert(repo.UpdateRecord(*conn, regraded));
  assert(repo.GetRecordById(*conn, rejected.id)->progress == 40);

  assert(repo.PurgeRecordsOfPlayer(*conn, verifier.id));
  assert(!repo.GetRecordById(*conn, submitted.id).has_value());
  assert(repo.GetRecordById(*conn, approved.id)->status == RecordStatus::kRejected);
  assert(repo.GetRecordById(*conn, rejected.id)->status == RecordStatus::kRejected);

  assert(repo.DeleteRecord(*conn, rejected.id));
  assert(repo.DeleteRecord(*conn, rejected.id).code == ErrorCode::NotFound);
}

void VerifyUsers(Repository& repo) {
  auto conn = repo.Acquire();

  dbm::User helper{.id = 0, .name = "helper", .display_name = std::nullopt, .youtube_channel = std::nullopt,
                   .password_hash = "hash-1", .permissions = PermissionSet{Permission::kListHelper}};
  dbm::User admin{.id = 0, .name = "admin", .display_name = std::string("The Admin"), .youtube_channel = std::nullopt,
                  .password_hash = "hash-2", .permissions = PermissionSet{Permission::kAdministrator}};
  assert(repo.InsertUser(*conn, helper));
  assert(repo.InsertUser(*conn, admin));

  auto clash = helper;
  assert(repo.InsertUser(*conn, clash).code == ErrorCode::AlreadyExists);

  const auto read = repo.GetUserByName(*conn, "admin");
  assert(read.has_value());
  assert(read->display_name == std::string("The Admin"));
  assert(read->permissions == PermissionSet{Permission::kAdministrator});

  Keyset all;
  all.limit = 10;
  UserFilter team;
  team.has_permissions = demonlist::model::ListTeam();
  const auto members   = repo.ListUsers(*conn, team, all);
  assert(members.size() == 1 && members[0].id == helper.id);

  UserFilter named;
  named.display_name = "The Admin";
  assert(repo.ListUsers(*conn, named, all).size() == 1);

  helper.youtube_channel = "https://youtube.com/c/helper";
  helper.permissions     = PermissionSet{Permission::kListHelper, Permission::kListModerator};
  assert(repo.UpdateUser(*conn, helper));
  assert(repo.GetUserById(*conn, helper.id)->permissions.Contains(Permission::kListModerator));

  assert(repo.DeleteUser(*conn, admin.id));
  assert(!repo.GetUserById(*conn, admin.id).has_value());
  assert(repo.DeleteUser(*conn, admin.id).code == ErrorCode::NotFound);
}

void VerifyRollbackBehavior(Repository& repo) {
  auto conn = repo.Acquire();
  {
    auto tx = conn->Begin();
    assert(conn->InTransaction());
    InsertPlayer(repo, *conn, "rolled back");
    assert(repo.GetPlayerByName(*conn, "rolled back").has_value());
    tx->Rollback();
  }
  assert(!conn->InTransaction());
  assert(!repo.GetPlayerByName(*conn, "rolled back").has_value());

  {
    auto tx = conn->Begin();
    InsertPlayer(repo, *conn, "dropped");
  }
  assert(!repo.GetPlayerByName(*conn, "dropped").has_value());

  {
    auto tx = conn->Begin();
    InsertPlayer(repo, *conn, "committed");
    tx->Commit();
    assert(tx->IsCommitted());
  }

  auto other = repo.Acquire();
  assert(repo.GetPlayerByName(*other, "committed").has_value());
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto conn = repo->Acquire();
    InsertPlayer(*repo, *conn, "durable");
  }

  backend.restart(repo);

  auto conn = repo->Acquire();
  assert(repo->GetPlayerByName(*conn, "durable").has_value());
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if DEMONLIST_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("demonlist_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    RuntimeConfig config;
    config.mutable_database()->mutable_sqlite()->set_path(db_path);
    config.mutable_database()->set_max_connections(4);
    return demonlist::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup =
          [db_path]() {
            for (const auto* suffix : {"", "-wal", "-shm"}) std::filesystem::remove(db_path + suffix);
          },
  };
}
#endif

#if DEMONLIST_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("DEMONLIST_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("DEMONLIST_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    RuntimeConfig config;
    config.mutable_database()->mutable_postgres()->set_connection_uri(conninfo);
    config.mutable_database()->set_max_connections(4);
    return demonlist::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  =
          [make_repo]() {
            auto       repo = make_repo();
            auto       conn = repo->Acquire();
            pqxx::work tx(static_cast<demonlist::db::postgres::PgConnection&>(*conn).Raw());
            tx.exec("TRUNCATE records, demons, submitters, players, users RESTART IDENTITY CASCADE;");
            tx.commit();
            return repo;
          },
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";

  VerifyPlayers(*backend.make_repository());
  VerifyDemonsAndRecords(*backend.make_repository());
  VerifyUsers(*backend.make_repository());
  VerifyRollbackBehavior(*backend.make_repository());
  VerifyRestartDurability(backend);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if DEMONLIST_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if DEMONLIST_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& e) {
    std::cout << "skipping postgres backend: " << e.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "demonlist_integration_repository_parity: pass\n";
  return 0;
}
