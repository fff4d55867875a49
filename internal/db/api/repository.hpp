#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/connection.hpp"
#include "internal/db/api/result.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/demon.hpp"
#include "internal/db/model/player.hpp"
#include "internal/db/model/record.hpp"
#include "internal/db/model/submitter.hpp"
#include "internal/db/model/user.hpp"

namespace demonlist::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - Acquire() blocks until a pooled connection is free and throws
    util::ConnectionUnavailable when the pool cannot provide one
  - Reads inside a transaction see its writes
  - Writes return a Result; reads return optionals and throw
    util::DatabaseError on backend failure
  - Inserts assign the generated id into the passed row
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Connections
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Connection> Acquire() = 0;

  // ---------------------------------------------------------------------
  // Players
  // ---------------------------------------------------------------------

  virtual std::optional<model::Player> GetPlayerById(Connection&, std::int64_t id) = 0;

  virtual std::optional<model::Player> GetPlayerByName(Connection&, const std::string& name) = 0;

  virtual Result InsertPlayer(Connection&, model::Player&) = 0;

  virtual Result UpdatePlayer(Connection&, const model::Player&) = 0;

  virtual std::vector<model::Player> ListPlayers(Connection&, const PlayerFilter&, const Keyset&) = 0;

  // ---------------------------------------------------------------------
  // Demons
  // ---------------------------------------------------------------------

  virtual std::optional<model::Demon> GetDemonByName(Connection&, const std::string& name) = 0;

  virtual Result InsertDemon(Connection&, const model::Demon&) = 0;

  // Writes every column except position. `name` identifies the row, the
  // demon may carry a new name; records follow the rename.
  virtual Result UpdateDemon(Connection&, const std::string& name, const model::Demon&) = 0;

  // Moves the demon to `position`, shifting the demons in between by one.
  virtual Result MoveDemon(Connection&, const std::string& name, int position) = 0;

  virtual int MaxDemonPosition(Connection&) = 0;

  // ---------------------------------------------------------------------
  // Submitters
  // ---------------------------------------------------------------------

  virtual std::optional<model::Submitter> GetSubmitterById(Connection&, std::int64_t id) = 0;

  virtual std::optional<model::Submitter> GetSubmitterByIp(Connection&, const std::string& ip) = 0;

  virtual Result InsertSubmitter(Connection&, model::Submitter&) = 0;

  virtual Result UpdateSubmitter(Connection&, const model::Submitter&) = 0;

  // ---------------------------------------------------------------------
  // Records
  // ---------------------------------------------------------------------

  virtual std::optional<model::Record> GetRecordById(Connection&, std::int64_t id) = 0;

  // Records matching (player, demon), or carrying `video` when given.
  // Ordered: rejected first, then highest progress, then lowest id.
  virtual std::vector<model::Record> FindMatchingRecords(Connection&, std::int64_t player, const std::string& demon,
                                                         const std::optional<std::string>& video) = 0;

  virtual Result InsertRecord(Connection&, model::Record&) = 0;

  virtual Result UpdateRecord(Connection&, const model::Record&) = 0;

  // NotFound when no such record exists.
  virtual Result DeleteRecord(Connection&, std::int64_t id) = 0;

  // Deletes the player's submitted records and rejects all remaining ones.
  virtual Result PurgeRecordsOfPlayer(Connection&, std::int64_t player) = 0;

  virtual std::vector<model::Record> ListRecords(Connection&, const RecordFilter&, const Keyset&) = 0;

  // ---------------------------------------------------------------------
  // Users
  // ---------------------------------------------------------------------

  virtual std::optional<model::User> GetUserById(Connection&, std::int64_t id) = 0;

  virtual std::optional<model::User> GetUserByName(Connection&, const std::string& name) = 0;

  virtual Result InsertUser(Connection&, model::User&) = 0;

  virtual Result UpdateUser(Connection&, const model::User&) = 0;

  // NotFound when no such user exists.
  virtual Result DeleteUser(Connection&, std::int64_t id) = 0;

  virtual std::vector<model::User> ListUsers(Connection&, const UserFilter&, const Keyset&) = 0;
};

} // namespace demonlist::db
