#include "sqlite_repository.hpp"

#include <utility>

#include "internal/db/sql/list_queries.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace demonlist::db::sqlite {

using demonlist::db::ErrorCode;
using demonlist::db::Result;
using demonlist::model::PermissionSet;
using demonlist::model::RecordStatus;

namespace {

model::Player ReadPlayer(const Statement& st) {
  model::Player r;
  r.id     = st.ColInt64(0);
  r.name   = st.ColText(1);
  r.banned = st.ColInt(2) != 0;
  return r;
}

model::Demon ReadDemon(const Statement& st) {
  model::Demon r;
  r.name        = st.ColText(0);
  r.position    = st.ColInt(1);
  r.requirement = st.ColInt(2);
  r.video       = st.ColOptText(3);
  r.verifier    = st.ColInt64(4);
  r.publisher   = st.ColInt64(5);
  return r;
}

model::Submitter ReadSubmitter(const Statement& st) {
  model::Submitter r;
  r.id     = st.ColInt64(0);
  r.ip     = st.ColText(1);
  r.banned = st.ColInt(2) != 0;
  return r;
}

model::Record ReadRecord(const Statement& st) {
  model::Record r;
  r.id        = st.ColInt64(0);
  r.progress  = st.ColInt(1);
  r.video     = st.ColOptText(2);
  r.status    = static_cast<RecordStatus>(st.ColInt(3));
  r.player    = st.ColInt64(4);
  r.submitter = st.ColInt64(5);
  r.demon     = st.ColText(6);
  return r;
}

model::User ReadUser(const Statement& st) {
  model::User r;
  r.id              = st.ColInt64(0);
  r.name            = st.ColText(1);
  r.display_name    = st.ColOptText(2);
  r.youtube_channel = st.ColOptText(3);
  r.password_hash   = st.ColText(4);
  r.permissions     = PermissionSet::FromBits(static_cast<std::uint16_t>(st.ColInt(5)));
  return r;
}

template <typename Mapper, typename... Args>
auto QueryOne(sqlite3* db, const char* sql, Mapper&& map, const Args&... args) -> std::optional<decltype(map(std::declval<const Statement&>()))> {
  Statement st(db, sql);
  st.BindAll(args...);

  const int rc = st.Step();
  if (rc == SQLITE_ROW) return map(st);
  if (rc == SQLITE_DONE) return std::nullopt;
  throw util::DatabaseError(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

template <typename Mapper>
auto QueryMany(sqlite3* db, const sql::Query& query, Mapper&& map) {
  Statement st(db, query.text.c_str());
  for (const auto& param : query.params) st.Bind(param);

  std::vector<decltype(map(st))> rows;
  for (;;) {
    const int rc = st.Step();
    if (rc == SQLITE_DONE) break;
    if (rc != SQLITE_ROW) throw util::DatabaseError(std::string("sqlite step: ") + sqlite3_errmsg(db));
    rows.push_back(map(st));
  }
  return rows;
}

} // namespace

SqliteRepository::SqliteRepository(std::string path, std::size_t max_connections, std::chrono::milliseconds acquire_timeout)
    : pool_(std::make_shared<ConnectionPool<SqliteDB>>([path] { return std::make_unique<SqliteDB>(path); }, max_connections,
                                                        acquire_timeout)) {
}

std::unique_ptr<Connection> SqliteRepository::Acquire() {
  return std::make_unique<SqliteConnection>(pool_->Acquire());
}

sqlite3* SqliteRepository::Handle(Connection& c) {
  return static_cast<SqliteConnection&>(c).Handle();
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_UNIQUE || sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

namespace {

// Runs one write statement. `require_row` turns "no row changed" into NotFound.
template <typename... Args>
Result ExecWrite(sqlite3* db, Result (*translate)(sqlite3*, int), bool require_row, const char* sql, const Args&... args) {
  try {
    Statement st(db, sql);
    st.BindAll(args...);
    const int rc = st.Step();
    if (rc != SQLITE_DONE) return translate(db, rc);
    if (require_row && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const util::DatabaseError& e) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }
}

} // namespace

// ------------------------------------------------------------------
// Players
// ------------------------------------------------------------------

std::optional<model::Player> SqliteRepository::GetPlayerById(Connection& c, std::int64_t id) {
  return QueryOne(Handle(c), sql::SELECT_PLAYER_BY_ID, ReadPlayer, id);
}

std::optional<model::Player> SqliteRepository::GetPlayerByName(Connection& c, const std::string& name) {
  return QueryOne(Handle(c), sql::SELECT_PLAYER_BY_NAME, ReadPlayer, name);
}

Result SqliteRepository::InsertPlayer(Connection& c, model::Player& r) {
  auto* db  = Handle(c);
  auto  res = ExecWrite(db, &Translate, false, sql::INSERT_PLAYER, r.name, r.banned);
  if (res) r.id = sqlite3_last_insert_rowid(db);
  return res;
}

Result SqliteRepository::UpdatePlayer(Connection& c, const model::Player& r) {
  return ExecWrite(Handle(c), &Translate, true, sql::UPDATE_PLAYER, r.name, r.banned, r.id);
}

std::vector<model::Player> SqliteRepository::ListPlayers(Connection& c, const PlayerFilter& filter, const Keyset& keyset) {
  return QueryMany(Handle(c), sql::BuildPlayerListQuery(filter, keyset), ReadPlayer);
}

// ------------------------------------------------------------------
// Demons
// ------------------------------------------------------------------

std::optional<model::Demon> SqliteRepository::GetDemonByName(Connection& c, const std::string& name) {
  return QueryOne(Handle(c), sql::SELECT_DEMON_BY_NAME, ReadDemon, name);
}

Result SqliteRepository::InsertDemon(Connection& c, const model::Demon& r) {
  return ExecWrite(Handle(c), &Translate, false, sql::INSERT_DEMON, r.name, r.position, r.requirement, r.video, r.verifier, r.publisher);
}

Result SqliteRepository::UpdateDemon(Connection& c, const std::string& name, const model::Demon& r) {
  return ExecWrite(Handle(c), &Translate, true, sql::UPDATE_DEMON, r.name, r.requirement, r.video, r.verifier, r.publisher, name);
}

Result SqliteRepository::MoveDemon(Connection& c, const std::string& name, int position) {
  auto* db   = Handle(c);
  auto  from = QueryOne(db, sql::SELECT_DEMON_POSITION, [](const Statement& st) { return st.ColInt(0); }, name);
  if (!from) return Result::Err(ErrorCode::NotFound);

  if (position > *from) {
    auto res = ExecWrite(db, &Translate, false, sql::SHIFT_DEMONS_UP, *from, position, name);
    if (!res) return res;
  } else if (position < *from) {
    auto res = ExecWrite(db, &Translate, false, sql::SHIFT_DEMONS_DOWN, position, *from, name);
    if (!res) return res;
  }
  return ExecWrite(db, &Translate, true, sql::SET_DEMON_POSITION, position, name);
}

int SqliteRepository::MaxDemonPosition(Connection& c) {
  return QueryOne(Handle(c), sql::SELECT_MAX_DEMON_POSITION, [](const Statement& st) { return st.ColInt(0); }).value_or(0);
}

// ------------------------------------------------------------------
// Submitters
// ------------------------------------------------------------------

std::optional<model::Submitter> SqliteRepository::GetSubmitterById(Connection& c, std::int64_t id) {
  return QueryOne(Handle(c), sql::SELECT_SUBMITTER_BY_ID, ReadSubmitter, id);
}

std::optional<model::Submitter> SqliteRepository::GetSubmitterByIp(Connection& c, const std::string& ip) {
  return QueryOne(Handle(c), sql::SELECT_SUBMITTER_BY_IP, ReadSubmitter, ip);
}

Result SqliteRepository::InsertSubmitter(Connection& c, model::Submitter& r) {
  auto* db  = Handle(c);
  auto  res = ExecWrite(db, &Translate, false, sql::INSERT_SUBMITTER, r.ip, r.banned);
  if (res) r.id = sqlite3_last_insert_rowid(db);
  return res;
}

Result SqliteRepository::UpdateSubmitter(Connection& c, const model::Submitter& r) {
  return ExecWrite(Handle(c), &Translate, true, sql::UPDATE_SUBMITTER, r.ip, r.banned, r.id);
}

// ------------------------------------------------------------------
// Records
// ------------------------------------------------------------------

std::optional<model::Record> SqliteRepository::GetRecordById(Connection& c, std::int64_t id) {
  return QueryOne(Handle(c), sql::SELECT_RECORD_BY_ID, ReadRecord, id);
}

std::vector<model::Record> SqliteRepository::FindMatchingRecords(Connection& c, std::int64_t player, const std::string& demon,
                                                                 const std::optional<std::string>& video) {
  sql::Query query{sql::SELECT_MATCHING_RECORDS, {player, demon, video ? sql::Param{*video} : sql::Param{nullptr}}};
  return QueryMany(Handle(c), query, ReadRecord);
}

Result SqliteRepository::InsertRecord(Connection& c, model::Record& r) {
  auto* db  = Handle(c);
  auto  res = ExecWrite(db, &Translate, false, sql::INSERT_RECORD, r.progress, r.video, static_cast<std::int32_t>(r.status), r.player,
                        r.submitter, r.demon);
  if (res) r.id = sqlite3_last_insert_rowid(db);
  return res;
}

Result SqliteRepository::UpdateRecord(Connection& c, const model::Record& r) {
  return ExecWrite(Handle(c), &Translate, true, sql::UPDATE_RECORD, r.progress, r.video, static_cast<std::int32_t>(r.status), r.player,
                   r.submitter, r.demon, r.id);
}

Result SqliteRepository::DeleteRecord(Connection& c, std::int64_t id) {
  return ExecWrite(Handle(c), &Translate, true, sql::DELETE_RECORD, id);
}

Result SqliteRepository::PurgeRecordsOfPlayer(Connection& c, std::int64_t player) {
  auto* db  = Handle(c);
  auto  res = ExecWrite(db, &Translate, false, sql::DELETE_SUBMITTED_RECORDS_OF_PLAYER, player);
  if (!res) return res;
  return ExecWrite(db, &Translate, false, sql::REJECT_RECORDS_OF_PLAYER, player);
}

std::vector<model::Record> SqliteRepository::ListRecords(Connection& c, const RecordFilter& filter, const Keyset& keyset) {
  return QueryMany(Handle(c), sql::BuildRecordListQuery(filter, keyset), ReadRecord);
}

// ------------------------------------------------------------------
// Users
// ------------------------------------------------------------------

std::optional<model::User> SqliteRepository::GetUserById(Connection& c, std::int64_t id) {
  return QueryOne(Handle(c), sql::SELECT_USER_BY_ID, ReadUser, id);
}

std::optional<model::User> SqliteRepository::GetUserByName(Connection& c, const std::string& name) {
  return QueryOne(Handle(c), sql::SELECT_USER_BY_NAME, ReadUser, name);
}

Result SqliteRepository::InsertUser(Connection& c, model::User& r) {
  auto* db  = Handle(c);
  auto  res = ExecWrite(db, &Translate, false, sql::INSERT_USER, r.name, r.display_name, r.youtube_channel, r.password_hash,
                        static_cast<std::int32_t>(r.permissions.Bits()));
  if (res) r.id = sqlite3_last_insert_rowid(db);
  return res;
}

Result SqliteRepository::UpdateUser(Connection& c, const model::User& r) {
  return ExecWrite(Handle(c), &Translate, true, sql::UPDATE_USER, r.name, r.display_name, r.youtube_channel, r.password_hash,
                   static_cast<std::int32_t>(r.permissions.Bits()), r.id);
}

Result SqliteRepository::DeleteUser(Connection& c, std::int64_t id) {
  return ExecWrite(Handle(c), &Translate, true, sql::DELETE_USER, id);
}

std::vector<model::User> SqliteRepository::ListUsers(Connection& c, const UserFilter& filter, const Keyset& keyset) {
  return QueryMany(Handle(c), sql::BuildUserListQuery(filter, keyset), ReadUser);
}

} // namespace demonlist::db::sqlite
