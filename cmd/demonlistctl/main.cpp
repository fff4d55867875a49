#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/commands/lookups.hpp"
#include "internal/commands/submission.hpp"
#include "internal/commands/users.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/context/request_context.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pagination/paginate.hpp"
#include "internal/pagination/player_pagination.hpp"
#include "internal/pagination/record_pagination.hpp"
#include "internal/pagination/user_pagination.hpp"
#include "internal/patch/demon_patch.hpp"
#include "internal/patch/patch.hpp"
#include "internal/patch/player_patch.hpp"
#include "internal/patch/user_patch.hpp"
#include "internal/util/errors.hpp"

using namespace demonlist;

using context::RequestData;

static void Usage() {
  std::cout << "Usage:\n"
            << "  demonlistctl --config <config.yaml> players [name]\n"
            << "  demonlistctl --config <config.yaml> records [submitted|approved|rejected] [after_id]\n"
            << "  demonlistctl --config <config.yaml> users\n"
            << "  demonlistctl --config <config.yaml> submit <player> <demon> <progress> [video]\n"
            << "  demonlistctl --config <config.yaml> delete-record <id>\n"
            << "  demonlistctl --config <config.yaml> ban <player_id>\n"
            << "  demonlistctl --config <config.yaml> unban <player_id>\n"
            << "  demonlistctl --config <config.yaml> move-demon <name> <position>\n"
            << "  demonlistctl --config <config.yaml> register <name> <password>\n"
            << "  demonlistctl --config <config.yaml> grant <user_id> <Permission[,Permission...]>\n"
            << "  demonlistctl --config <config.yaml> token <name> <password>\n"
            << "  demonlistctl --config <config.yaml> invalidate <name> <password>\n";
}

static std::int64_t ParseId(const std::string& value) {
  try {
    std::size_t used = 0;
    const auto  id   = std::stoll(value, &used);
    if (used == value.size()) return id;
  } catch (const std::exception&) {
  }
  std::cerr << "invalid number: '" << value << "'\n";
  std::exit(1);
}

static model::PermissionSet ParsePermissions(const std::string& value) {
  static const model::Permission kAll[] = {model::Permission::kExtendedAccess,    model::Permission::kListHelper,
                                           model::Permission::kListModerator,     model::Permission::kListAdministrator,
                                           model::Permission::kLeaderboardModerator, model::Permission::kModerator,
                                           model::Permission::kAdministrator};

  model::PermissionSet result;
  std::size_t          start = 0;
  while (start <= value.size()) {
    auto end = value.find(',', start);
    if (end == std::string::npos) end = value.size();
    const auto name = value.substr(start, end - start);
    if (!name.empty()) {
      bool known = false;
      for (const auto permission : kAll) {
        if (model::PermissionName(permission) == name) {
          result |= model::PermissionSet{permission};
          known = true;
        }
      }
      if (!known) {
        std::cerr << "unknown permission: '" << name << "'\n";
        std::exit(1);
      }
    }
    start = end + 1;
  }
  return result;
}

static void PrintPlayer(const db::model::Player& player) {
  std::cout << player.id << "\t" << player.name << (player.banned ? "\tbanned" : "") << "\n";
}

static void PrintRecord(const db::model::Record& record) {
  std::cout << record.id << "\t" << record.demon << "\tplayer=" << record.player << "\t" << record.progress << "%\t"
            << model::ToString(record.status) << "\t" << record.video.value_or("-") << "\n";
}

static void PrintUser(const db::model::User& user) {
  std::cout << user.id << "\t" << user.name << "\t" << user.display_name.value_or("-") << "\t" << user.permissions.ToString() << "\n";
}

static void PrintNavigation(const pagination::Navigation& navigation) {
  if (!navigation.Empty()) std::cout << "Link: " << navigation.ToLinkHeader() << "\n";
}

static int Run(executor::WorkerPool& pool, const std::vector<std::string>& args) {
  const auto& cmd = args[0];

  if (cmd == "players" && args.size() <= 2) {
    pagination::PlayerPagination players;
    if (args.size() == 2) players.name = args[1];
    auto page = pool.Send(pagination::Paginate<pagination::PlayerPagination>{RequestData::Internal(), players});
    for (const auto& player : page.items) PrintPlayer(player);
    PrintNavigation(page.navigation);
    return 0;
  }

  if (cmd == "records" && args.size() <= 3) {
    pagination::RecordPagination records;
    if (args.size() >= 2) {
      records.status = model::ParseRecordStatus(args[1]);
      if (!records.status) {
        std::cerr << "unknown record status: '" << args[1] << "'\n";
        return 1;
      }
    }
    if (args.size() == 3) records.after = ParseId(args[2]);
    auto page = pool.Send(pagination::Paginate<pagination::RecordPagination>{RequestData::Internal(), records});
    for (const auto& record : page.items) PrintRecord(record);
    PrintNavigation(page.navigation);
    return 0;
  }

  if (cmd == "users" && args.size() == 1) {
    auto page = pool.Send(pagination::Paginate<pagination::UserPagination>{RequestData::Internal(), pagination::UserPagination{}});
    for (const auto& user : page.items) PrintUser(user);
    PrintNavigation(page.navigation);
    return 0;
  }

  if (cmd == "submit" && (args.size() == 4 || args.size() == 5)) {
    commands::Submission submission;
    submission.player   = args[1];
    submission.demon    = args[2];
    submission.progress = static_cast<int>(ParseId(args[3]));
    if (args.size() == 5) submission.video = args[4];

    auto submitter = pool.Send(commands::SubmitterByIp{"127.0.0.1"});
    auto record    = pool.Send(commands::ProcessSubmission{submission, submitter});
    if (record) PrintRecord(*record);
    return 0;
  }

  if (cmd == "delete-record" && args.size() == 2) {
    pool.Send(commands::DeleteRecordById{RequestData::Internal(), ParseId(args[1])});
    std::cout << "deleted\n";
    return 0;
  }

  if ((cmd == "ban" || cmd == "unban") && args.size() == 2) {
    patch::PatchPlayer ban;
    ban.banned = patch::PatchField<bool>::Of(cmd == "ban");
    PrintPlayer(pool.Send(patch::Patch<patch::PatchPlayer>{RequestData::Internal(), ParseId(args[1]), ban}));
    return 0;
  }

  if (cmd == "move-demon" && args.size() == 3) {
    patch::PatchDemon move;
    move.position = patch::PatchField<int>::Of(static_cast<int>(ParseId(args[2])));
    auto demon    = pool.Send(patch::Patch<patch::PatchDemon>{RequestData::Internal(), args[1], move});
    std::cout << demon.position << "\t" << demon.name << "\n";
    return 0;
  }

  if (cmd == "register" && args.size() == 3) {
    PrintUser(pool.Send(commands::Register{args[1], args[2]}));
    return 0;
  }

  if (cmd == "grant" && args.size() == 3) {
    patch::PatchUser grant;
    grant.permissions = patch::PatchField<model::PermissionSet>::Of(ParsePermissions(args[2]));
    PrintUser(pool.Send(patch::Patch<patch::PatchUser>{RequestData::Internal(), ParseId(args[1]), grant}));
    return 0;
  }

  if (cmd == "token" && args.size() == 3) {
    auto user = pool.Send(commands::BasicAuth{args[1], args[2]});
    std::cout << pool.Send(commands::IssueToken{user}) << "\n";
    return 0;
  }

  if (cmd == "invalidate" && args.size() == 3) {
    pool.Send(commands::Invalidate{args[1], args[2]});
    std::cout << "invalidated\n";
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string        config_path = argv[2];
  std::vector<std::string> args(argv + 3, argv + argc);

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config::ConfigLoader::LoadFromYaml(config_path);
    observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build runtime (dependency graph + workers)
    // ------------------------------------------------------------
    auto runtime = factory::BuildRuntime(config);

    const int rc = Run(*runtime.workers, args);

    runtime.workers->Stop();
    observability::ShutdownLogging();
    return rc;
  } catch (const util::Error& e) {
    std::cerr << "error " << e.Code() << ": " << e.what() << "\n";
    observability::ShutdownLogging();
    return 2;
  } catch (const std::exception& e) {
    DEMONLIST_LOG_ERROR("Fatal error", {observability::StringField("error", e.what())});
    observability::ShutdownLogging();
    return 2;
  }
}
