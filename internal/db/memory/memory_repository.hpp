#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "internal/db/api/connection_pool.hpp"
#include "internal/db/api/repository.hpp"

namespace demonlist::db::memory {

class MemoryConnection;
class MemoryTransaction;

/*
  In-process repository used by tests and by the default runtime.

  Concurrency model mirrors SQLite: any number of readers, one writer.
  A transaction holds the writer lock from Begin() until it commits or
  rolls back and works on a private copy of the committed state.
  Autocommit writes take the writer lock for the single statement.
*/
class MemoryRepository final : public db::Repository {
 public:
  explicit MemoryRepository(std::size_t max_connections = 16, std::chrono::milliseconds acquire_timeout = std::chrono::milliseconds::zero());

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

  // Number of transactions opened so far, committed or not.
  std::size_t TransactionsBegun() const {
    return transactions_begun_.load();
  }

 private:
  friend class MemoryConnection;
  friend class MemoryTransaction;

  struct State {
    std::map<std::int64_t, model::Player>    players;
    std::map<std::string, model::Demon>      demons;
    std::map<std::int64_t, model::Submitter> submitters;
    std::map<std::int64_t, model::Record>    records;
    std::map<std::int64_t, model::User>      users;

    std::int64_t next_player_id    = 1;
    std::int64_t next_submitter_id = 1;
    std::int64_t next_record_id    = 1;
    std::int64_t next_user_id      = 1;
  };

  // Pool token; the memory backend has no physical connection.
  struct Slot {};

  template <typename Fn>
  auto Read(Connection& conn, Fn&& fn);

  template <typename Fn>
  Result Write(Connection& conn, Fn&& fn);

  std::shared_ptr<ConnectionPool<Slot>> pool_;

  std::mutex         writer_mutex_;
  mutable std::mutex state_mutex_;
  State              committed_;

  std::atomic<std::size_t> transactions_begun_{0};
};

} // namespace demonlist::db::memory
