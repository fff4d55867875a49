#include "pg_repository.hpp"

#include <type_traits>
#include <variant>

#include "internal/db/sql/list_queries.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace demonlist::db::postgres {

using demonlist::model::PermissionSet;
using demonlist::model::RecordStatus;

namespace {

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

model::Player ReadPlayer(const pqxx::row& row) {
  model::Player r;
  r.id     = row[0].as<std::int64_t>();
  r.name   = row[1].c_str();
  r.banned = row[2].as<bool>();
  return r;
}

model::Demon ReadDemon(const pqxx::row& row) {
  model::Demon r;
  r.name        = row[0].c_str();
  r.position    = row[1].as<int>();
  r.requirement = row[2].as<int>();
  r.video       = OptText(row[3]);
  r.verifier    = row[4].as<std::int64_t>();
  r.publisher   = row[5].as<std::int64_t>();
  return r;
}

model::Submitter ReadSubmitter(const pqxx::row& row) {
  model::Submitter r;
  r.id     = row[0].as<std::int64_t>();
  r.ip     = row[1].c_str();
  r.banned = row[2].as<bool>();
  return r;
}

model::Record ReadRecord(const pqxx::row& row) {
  model::Record r;
  r.id        = row[0].as<std::int64_t>();
  r.progress  = row[1].as<int>();
  r.video     = OptText(row[2]);
  r.status    = static_cast<RecordStatus>(row[3].as<int>());
  r.player    = row[4].as<std::int64_t>();
  r.submitter = row[5].as<std::int64_t>();
  r.demon     = row[6].c_str();
  return r;
}

model::User ReadUser(const pqxx::row& row) {
  model::User r;
  r.id              = row[0].as<std::int64_t>();
  r.name            = row[1].c_str();
  r.display_name    = OptText(row[2]);
  r.youtube_channel = OptText(row[3]);
  r.password_hash   = row[4].c_str();
  r.permissions     = PermissionSet::FromBits(static_cast<std::uint16_t>(row[5].as<int>()));
  return r;
}

pqxx::params ToPqxx(const sql::Params& params) {
  pqxx::params out;
  for (const auto& param : params) {
    std::visit(
        [&](const auto& v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out.append();
          } else {
            out.append(v);
          }
        },
        param);
  }
  return out;
}

sql::Param Opt(const std::optional<std::string>& value) {
  if (!value) return nullptr;
  return *value;
}

std::string Returning(const char* insert) {
  return sql::ToDollarPlaceholders(insert) + " RETURNING id;";
}

template <typename Mapper>
auto First(const pqxx::result& res, Mapper&& map) -> std::optional<decltype(map(res[0]))> {
  if (res.empty()) return std::nullopt;
  return map(res[0]);
}

template <typename Mapper>
auto All(const pqxx::result& res, Mapper&& map) {
  std::vector<decltype(map(res[0]))> rows;
  rows.reserve(res.size());
  for (const auto& row : res) rows.push_back(map(row));
  return rows;
}

} // namespace

PgRepository::PgRepository(std::string conninfo, std::size_t max_connections, std::chrono::milliseconds acquire_timeout)
    : pool_(std::make_shared<ConnectionPool<pqxx::connection>>([conninfo] { return std::make_unique<pqxx::connection>(conninfo); },
                                                                max_connections, acquire_timeout)) {
}

std::unique_ptr<Connection> PgRepository::Acquire() {
  return std::make_unique<PgConnection>(pool_->Acquire());
}

pqxx::result PgRepository::Run(Connection& c, const std::string& sql, const sql::Params& params) {
  auto&      conn = static_cast<PgConnection&>(c);
  const auto text = sql::ToDollarPlaceholders(sql);
  try {
    if (auto* work = conn.ActiveWork()) {
      return work->exec_params(text, ToPqxx(params));
    }
    pqxx::nontransaction autocommit(conn.Raw());
    return autocommit.exec_params(text, ToPqxx(params));
  } catch (const pqxx::broken_connection& e) {
    throw util::DatabaseError(std::string("connection lost: ") + e.what());
  }
}

Result PgRepository::Write(Connection& c, const std::string& sql, const sql::Params& params, bool require_row) {
  try {
    auto res = Run(c, sql, params);
    if (require_row && res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const util::DatabaseError*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

namespace {

// Reads surface driver failures as util::DatabaseError.
template <typename Fn>
auto Guard(Fn&& fn) {
  try {
    return fn();
  } catch (const util::Error&) {
    throw;
  } catch (const std::exception& e) {
    throw util::DatabaseError(e.what());
  }
}

} // namespace

// ------------------------------------------------------------------
// Players
// ------------------------------------------------------------------

std::optional<model::Player> PgRepository::GetPlayerById(Connection& c, std::int64_t id) {
  return Guard([&] { return First(Run(c, sql::SELECT_PLAYER_BY_ID, {id}), ReadPlayer); });
}

std::optional<model::Player> PgRepository::GetPlayerByName(Connection& c, const std::string& name) {
  return Guard([&] { return First(Run(c, sql::SELECT_PLAYER_BY_NAME, {name}), ReadPlayer); });
}

Result PgRepository::InsertPlayer(Connection& c, model::Player& r) {
  try {
    auto res = Run(c, Returning(sql::INSERT_PLAYER), {r.name, r.banned});
    r.id     = res[0][0].as<std::int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdatePlayer(Connection& c, const model::Player& r) {
  return Write(c, sql::UPDATE_PLAYER, {r.name, r.banned, r.id}, true);
}

std::vector<model::Player> PgRepository::ListPlayers(Connection& c, const PlayerFilter& filter, const Keyset& keyset) {
  const auto query = sql::BuildPlayerListQuery(filter, keyset);
  return Guard([&] { return All(Run(c, query.text, query.params), ReadPlayer); });
}

// ------------------------------------------------------------------
// Demons
// ------------------------------------------------------------------

std::optional<model::Demon> PgRepository::GetDemonByName(Connection& c, const std::string& name) {
  return Guard([&] { return First(Run(c, sql::SELECT_DEMON_BY_NAME, {name}), ReadDemon); });
}

Result PgRepository::InsertDemon(Connection& c, const model::Demon& r) {
  return Write(c, sql::INSERT_DEMON, {r.name, r.position, r.requirement, Opt(r.video), r.verifier, r.publisher});
}

Result PgRepository::UpdateDemon(Connection& c, const std::string& name, const model::Demon& r) {
  return Write(c, sql::UPDATE_DEMON, {r.name, r.requirement, Opt(r.video), r.verifier, r.publisher, name}, true);
}

Result PgRepository::MoveDemon(Connection& c, const std::string& name, int position) {
  std::optional<int> from;
  try {
    from = First(Run(c, sql::SELECT_DEMON_POSITION, {name}), [](const pqxx::row& row) { return row[0].as<int>(); });
  } catch (const std::exception& e) {
    return Translate(e);
  }
  if (!from) return Result::Err(ErrorCode::NotFound);

  if (position > *from) {
    auto res = Write(c, sql::SHIFT_DEMONS_UP, {*from, position, name});
    if (!res) return res;
  } else if (position < *from) {
    auto res = Write(c, sql::SHIFT_DEMONS_DOWN, {position, *from, name});
    if (!res) return res;
  }
  return Write(c, sql::SET_DEMON_POSITION, {position, name}, true);
}

int PgRepository::MaxDemonPosition(Connection& c) {
  return Guard([&] { return Run(c, sql::SELECT_MAX_DEMON_POSITION, {})[0][0].as<int>(); });
}

// ------------------------------------------------------------------
// Submitters
// ------------------------------------------------------------------

std::optional<model::Submitter> PgRepository::GetSubmitterById(Connection& c, std::int64_t id) {
  return Guard([&] { return First(Run(c, sql::SELECT_SUBMITTER_BY_ID, {id}), ReadSubmitter); });
}

std::optional<model::Submitter> PgRepository::GetSubmitterByIp(Connection& c, const std::string& ip) {
  return Guard([&] { return First(Run(c, sql::SELECT_SUBMITTER_BY_IP, {ip}), ReadSubmitter); });
}

Result PgRepository::InsertSubmitter(Connection& c, model::Submitter& r) {
  try {
    auto res = Run(c, Returning(sql::INSERT_SUBMITTER), {r.ip, r.banned});
    r.id     = res[0][0].as<std::int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateSubmitter(Connection& c, const model::Submitter& r) {
  return Write(c, sql::UPDATE_SUBMITTER, {r.ip, r.banned, r.id}, true);
}

// ------------------------------------------------------------------
// Records
// ------------------------------------------------------------------

std::optional<model::Record> PgRepository::GetRecordById(Connection& c, std::int64_t id) {
  return Guard([&] { return First(Run(c, sql::SELECT_RECORD_BY_ID, {id}), ReadRecord); });
}

std::vector<model::Record> PgRepository::FindMatchingRecords(Connection& c, std::int64_t player, const std::string& demon,
                                                             const std::optional<std::string>& video) {
  return Guard([&] { return All(Run(c, sql::SELECT_MATCHING_RECORDS, {player, demon, Opt(video)}), ReadRecord); });
}

Result PgRepository::InsertRecord(Connection& c, model::Record& r) {
  try {
    auto res = Run(c, Returning(sql::INSERT_RECORD),
                   {r.progress, Opt(r.video), static_cast<std::int32_t>(r.status), r.player, r.submitter, r.demon});
    r.id = res[0][0].as<std::int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateRecord(Connection& c, const model::Record& r) {
  return Write(c, sql::UPDATE_RECORD,
               {r.progress, Opt(r.video), static_cast<std::int32_t>(r.status), r.player, r.submitter, r.demon, r.id}, true);
}

Result PgRepository::DeleteRecord(Connection& c, std::int64_t id) {
  return Write(c, sql::DELETE_RECORD, {id}, true);
}

Result PgRepository::PurgeRecordsOfPlayer(Connection& c, std::int64_t player) {
  auto res = Write(c, sql::DELETE_SUBMITTED_RECORDS_OF_PLAYER, {player});
  if (!res) return res;
  return Write(c, sql::REJECT_RECORDS_OF_PLAYER, {player});
}

std::vector<model::Record> PgRepository::ListRecords(Connection& c, const RecordFilter& filter, const Keyset& keyset) {
  const auto query = sql::BuildRecordListQuery(filter, keyset);
  return Guard([&] { return All(Run(c, query.text, query.params), ReadRecord); });
}

// ------------------------------------------------------------------
// Users
// ------------------------------------------------------------------

std::optional<model::User> PgRepository::GetUserById(Connection& c, std::int64_t id) {
  return Guard([&] { return First(Run(c, sql::SELECT_USER_BY_ID, {id}), ReadUser); });
}

std::optional<model::User> PgRepository::GetUserByName(Connection& c, const std::string& name) {
  return Guard([&] { return First(Run(c, sql::SELECT_USER_BY_NAME, {name}), ReadUser); });
}

Result PgRepository::InsertUser(Connection& c, model::User& r) {
  try {
    auto res = Run(c, Returning(sql::INSERT_USER),
                   {r.name, Opt(r.display_name), Opt(r.youtube_channel), r.password_hash, static_cast<std::int32_t>(r.permissions.Bits())});
    r.id = res[0][0].as<std::int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateUser(Connection& c, const model::User& r) {
  return Write(c, sql::UPDATE_USER,
               {r.name, Opt(r.display_name), Opt(r.youtube_channel), r.password_hash, static_cast<std::int32_t>(r.permissions.Bits()), r.id},
               true);
}

Result PgRepository::DeleteUser(Connection& c, std::int64_t id) {
  return Write(c, sql::DELETE_USER, {id}, true);
}

std::vector<model::User> PgRepository::ListUsers(Connection& c, const UserFilter& filter, const Keyset& keyset) {
  const auto query = sql::BuildUserListQuery(filter, keyset);
  return Guard([&] { return All(Run(c, query.text, query.params), ReadUser); });
}

} // namespace demonlist::db::postgres
