#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "internal/db/api/connection_pool.hpp"
#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace demonlist::db::sqlite {

/*
  Repository over one SQLite database file.

  Every pooled connection opens its own sqlite3 handle on `path`. A plain
  ":memory:" path would give each handle a separate database; use
  "file::memory:?cache=shared" for a shared in-memory store.
*/
class SqliteRepository final : public db::Repository {
 public:
  SqliteRepository(std::string path, std::size_t max_connections,
                   std::chrono::milliseconds acquire_timeout = std::chrono::milliseconds::zero());

  std::unique_ptr<Connection> Acquire() override;

  std::optional<model::Player> GetPlayerById(Connection&, std::int64_t id) override;
  std::optional<model::Player> GetPlayerByName(Connection&, const std::string& name) override;
  Result InsertPlayer(Connection&, model::Player&) override;
  Result UpdatePlayer(Connection&, const model::Player&) override;
  std::vector<model::Player> ListPlayers(Connection&, const PlayerFilter&, const Keyset&) override;

  std::optional<model::Demon> GetDemonByName(Connection&, const std::string& name) override;
  Result InsertDemon(Connection&, const model::Demon&) override;
  Result UpdateDemon(Connection&, const std::string& name, const model::Demon&) override;
  Result MoveDemon(Connection&, const std::string& name, int position) override;
  int MaxDemonPosition(Connection&) override;

  std::optional<model::Submitter> GetSubmitterById(Connection&, std::int64_t id) override;
  std::optional<model::Submitter> GetSubmitterByIp(Connection&, const std::string& ip) override;
  Result InsertSubmitter(Connection&, model::Submitter&) override;
  Result UpdateSubmitter(Connection&, const model::Submitter&) override;

  std::optional<model::Record> GetRecordById(Connection&, std::int64_t id) override;
  std::vector<model::Record> FindMatchingRecords(Connection&, std::int64_t player, const std::string& demon,
                                                 const std::optional<std::string>& video) override;
  Result InsertRecord(Connection&, model::Record&) override;
  Result UpdateRecord(Connection&, const model::Record&) override;
  Result DeleteRecord(Connection&, std::int64_t id) override;
  Result PurgeRecordsOfPlayer(Connection&, std::int64_t player) override;
  std::vector<model::Record> ListRecords(Connection&, const RecordFilter&, const Keyset&) override;

  std::optional<model::User> GetUserById(Connection&, std::int64_t id) override;
  std::optional<model::User> GetUserByName(Connection&, const std::string& name) override;
  Result InsertUser(Connection&, model::User&) override;
  Result UpdateUser(Connection&, const model::User&) override;
  Result DeleteUser(Connection&, std::int64_t id) override;
  std::vector<model::User> ListUsers(Connection&, const UserFilter&, const Keyset&) override;

 private:
  std::shared_ptr<ConnectionPool<SqliteDB>> pool_;

  static sqlite3* Handle(Connection& c);
  static Result Translate(sqlite3* db, int rc);
};

} // namespace demonlist::db::sqlite
