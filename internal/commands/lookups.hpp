#pragma once

#include <cstdint>
#include <string>

#include "internal/context/request_context.hpp"
#include "internal/db/model/demon.hpp"
#include "internal/db/model/player.hpp"
#include "internal/db/model/record.hpp"
#include "internal/db/model/submitter.hpp"
#include "internal/executor/database_executor.hpp"

namespace demonlist::commands {

using executor::DatabaseExecutor;

// Submitter for an address, created on first sight.
struct SubmitterByIp {
  using Result                       = db::model::Submitter;
  static constexpr const char* kName = "SubmitterByIp";

  std::string ip;

  Result Handle(DatabaseExecutor& executor) const;
};

// Player by exact name, created (unbanned) when unknown.
struct PlayerByName {
  using Result                       = db::model::Player;
  static constexpr const char* kName = "PlayerByName";

  std::string name;

  Result Handle(DatabaseExecutor& executor) const;
};

struct PlayerById {
  using Result                       = db::model::Player;
  static constexpr const char* kName = "PlayerById";

  std::int64_t id;

  Result Handle(DatabaseExecutor& executor) const;
};

struct DemonByName {
  using Result                       = db::model::Demon;
  static constexpr const char* kName = "DemonByName";

  std::string name;

  Result Handle(DatabaseExecutor& executor) const;
};

struct RecordById {
  using Result                       = db::model::Record;
  static constexpr const char* kName = "RecordById";

  std::int64_t id;

  Result Handle(DatabaseExecutor& executor) const;
};

// ListModerator or ListAdministrator on external requests.
struct DeleteRecordById {
  using Result                       = void;
  static constexpr const char* kName = "DeleteRecordById";

  context::RequestData request;
  std::int64_t         id;

  void Handle(DatabaseExecutor& executor) const;
};

} // namespace demonlist::commands
