#include "memory_repository.hpp"

#include <algorithm>
#include <tuple>

#include "internal/util/errors.hpp"
#include "memory_tx.hpp"

namespace demonlist::db::memory {

using demonlist::model::RecordStatus;

namespace {

MemoryConnection& Conn(Connection& c) {
  return static_cast<MemoryConnection&>(c);
}

bool InWindow(std::int64_t id, const Keyset& keyset) {
  if (keyset.after && id <= *keyset.after) return false;
  if (keyset.before && id >= *keyset.before) return false;
  return true;
}

template <typename Row, typename Pred>
std::vector<Row> Window(const std::map<std::int64_t, Row>& rows, const Keyset& keyset, Pred&& matches) {
  std::vector<Row> out;
  const auto       visit = [&](const Row& row) {
    if (out.size() >= keyset.limit) return false;
    if (InWindow(row.id, keyset) && matches(row)) out.push_back(row);
    return true;
  };

  if (keyset.descending) {
    for (auto it = rows.rbegin(); it != rows.rend(); ++it) {
      if (!visit(it->second)) break;
    }
  } else {
    for (const auto& [_, row] : rows) {
      if (!visit(row)) break;
    }
  }
  return out;
}

template <typename Row, typename Pred>
std::optional<Row> FindIf(const std::map<std::int64_t, Row>& rows, Pred&& pred) {
  for (const auto& [_, row] : rows) {
    if (pred(row)) return row;
  }
  return std::nullopt;
}

} // namespace

MemoryRepository::MemoryRepository(std::size_t max_connections, std::chrono::milliseconds acquire_timeout)
    : pool_(std::make_shared<ConnectionPool<Slot>>([] { return std::make_unique<Slot>(); }, max_connections, acquire_timeout)) {
}

std::unique_ptr<Connection> MemoryRepository::Acquire() {
  return std::make_unique<MemoryConnection>(*this, pool_->Acquire());
}

template <typename Fn>
auto MemoryRepository::Read(Connection& conn, Fn&& fn) {
  if (auto* tx = Conn(conn).Active()) {
    return fn(tx->View());
  }
  std::scoped_lock lock(state_mutex_);
  return fn(static_cast<const State&>(committed_));
}

template <typename Fn>
Result MemoryRepository::Write(Connection& conn, Fn&& fn) {
  if (auto* tx = Conn(conn).Active()) {
    return fn(tx->Mutable());
  }
  std::scoped_lock lock(writer_mutex_, state_mutex_);
  return fn(committed_);
}

// ------------------------------------------------------------------
// Players
// ------------------------------------------------------------------

std::optional<model::Player> MemoryRepository::GetPlayerById(Connection& c, std::int64_t id) {
  return Read(c, [&](const State& s) -> std::optional<model::Player> {
    auto it = s.players.find(id);
    if (it == s.players.end()) return std::nullopt;
    return it->second;
  });
}

std::optional<model::Player> MemoryRepository::GetPlayerByName(Connection& c, const std::string& name) {
  return Read(c, [&](const State& s) {
    return FindIf(s.players, [&](const model::Player& p) { return p.name == name; });
  });
}

Result MemoryRepository::InsertPlayer(Connection& c, model::Player& r) {
  return Write(c, [&](State& s) {
    if (FindIf(s.players, [&](const model::Player& p) { return p.name == r.name; })) {
      return Result::Err(ErrorCode::AlreadyExists, "player name");
    }
    r.id             = s.next_player_id++;
    s.players[r.id] = r;
    return Result::Ok();
  });
}

Result MemoryRepository::UpdatePlayer(Connection& c, const model::Player& r) {
  return Write(c, [&](State& s) {
    if (!s.players.contains(r.id)) return Result::Err(ErrorCode::NotFound);
    if (FindIf(s.players, [&](const model::Player& p) { return p.name == r.name && p.id != r.id; })) {
      return Result::Err(ErrorCode::AlreadyExists, "player name");
    }
    s.players[r.id] = r;
    return Result::Ok();
  });
}

std::vector<model::Player> MemoryRepository::ListPlayers(Connection& c, const PlayerFilter& filter, const Keyset& keyset) {
  return Read(c, [&](const State& s) {
    return Window(s.players, keyset, [&](const model::Player& p) {
      if (filter.name && p.name != *filter.name) return false;
      if (filter.banned && p.banned != *filter.banned) return false;
      return true;
    });
  });
}

// ------------------------------------------------------------------
// Demons
// ------------------------------------------------------------------

std::optional<model::Demon> MemoryRepository::GetDemonByName(Connection& c, const std::string& name) {
  return Read(c, [&](const State& s) -> std::optional<model::Demon> {
    auto it = s.demons.find(name);
    if (it == s.demons.end()) return std::nullopt;
    return it->second;
  });
}

Result MemoryRepository::InsertDemon(Connection& c, const model::Demon& r) {
  return Write(c, [&](State& s) {
    if (s.demons.contains(r.name)) return Result::Err(ErrorCode::AlreadyExists, "demon name");
    s.demons[r.name] = r;
    return Result::Ok();
  });
}

Result MemoryRepository::UpdateDemon(Connection& c, const std::string& name, const model::Demon& r) {
  return Write(c, [&](State& s) {
    auto it = s.demons.find(name);
    if (it == s.demons.end()) return Result::Err(ErrorCode::NotFound);
    if (r.name != name && s.demons.contains(r.name)) return Result::Err(ErrorCode::AlreadyExists, "demon name");

    model::Demon updated = r;
    updated.position     = it->second.position;
    s.demons.erase(it);
    s.demons[updated.name] = updated;

    if (updated.name != name) {
      for (auto& [_, record] : s.records) {
        if (record.demon == name) record.demon = updated.name;
      }
    }
    return Result::Ok();
  });
}

Result MemoryRepository::MoveDemon(Connection& c, const std::string& name, int position) {
  return Write(c, [&](State& s) {
    auto it = s.demons.find(name);
    if (it == s.demons.end()) return Result::Err(ErrorCode::NotFound);

    const int from = it->second.position;
    for (auto& [other_name, demon] : s.demons) {
      if (other_name == name) continue;
      if (position > from && demon.position > from && demon.position <= position) {
        --demon.position;
      } else if (position < from && demon.position >= position && demon.position < from) {
        ++demon.position;
      }
    }
    it->second.position = position;
    return Result::Ok();
  });
}

int MemoryRepository::MaxDemonPosition(Connection& c) {
  return Read(c, [](const State& s) {
    int max = 0;
    for (const auto& [_, demon] : s.demons) max = std::max(max, demon.position);
    return max;
  });
}

// ------------------------------------------------------------------
// Submitters
// ------------------------------------------------------------------

std::optional<model::Submitter> MemoryRepository::GetSubmitterById(Connection& c, std::int64_t id) {
  return Read(c, [&](const State& s) -> std::optional<model::Submitter> {
    auto it = s.submitters.find(id);
    if (it == s.submitters.end()) return std::nullopt;
    return it->second;
  });
}

std::optional<model::Submitter> MemoryRepository::GetSubmitterByIp(Connection& c, const std::string& ip) {
  return Read(c, [&](const State& s) {
    return FindIf(s.submitters, [&](const model::Submitter& r) { return r.ip == ip; });
  });
}

Result MemoryRepository::InsertSubmitter(Connection& c, model::Submitter& r) {
  return Write(c, [&](State& s) {
    if (FindIf(s.submitters, [&](const model::Submitter& other) { return other.ip == r.ip; })) {
      return Result::Err(ErrorCode::AlreadyExists, "submitter ip");
    }
    r.id                = s.next_submitter_id++;
    s.submitters[r.id] = r;
    return Result::Ok();
  });
}

Result MemoryRepository::UpdateSubmitter(Connection& c, const model::Submitter& r) {
  return Write(c, [&](State& s) {
    if (!s.submitters.contains(r.id)) return Result::Err(ErrorCode::NotFound);
    s.submitters[r.id] = r;
    return Result::Ok();
  });
}

// ------------------------------------------------------------------
// Records
// ------------------------------------------------------------------

std::optional<model::Record> MemoryRepository::GetRecordById(Connection& c, std::int64_t id) {
  return Read(c, [&](const State& s) -> std::optional<model::Record> {
    auto it = s.records.find(id);
    if (it == s.records.end()) return std::nullopt;
    return it->second;
  });
}

std::vector<model::Record> MemoryRepository::FindMatchingRecords(Connection& c, std::int64_t player, const std::string& demon,
                                                                 const std::optional<std::string>& video) {
  auto matches = Read(c, [&](const State& s) {
    std::vector<model::Record> out;
    for (const auto& [_, record] : s.records) {
      const bool same_pair  = record.player == player && record.demon == demon;
      const bool same_video = video && record.video == video;
      if (same_pair || same_video) out.push_back(record);
    }
    return out;
  });

  std::sort(matches.begin(), matches.end(), [](const model::Record& a, const model::Record& b) {
    return std::make_tuple(a.status != RecordStatus::kRejected, -a.progress, a.id) <
           std::make_tuple(b.status != RecordStatus::kRejected, -b.progress, b.id);
  });
  return matches;
}

Result MemoryRepository::InsertRecord(Connection& c, model::Record& r) {
  return Write(c, [&](State& s) {
    if (!s.players.contains(r.player)) return Result::Err(ErrorCode::ConstraintViolation, "record player");
    if (!s.demons.contains(r.demon)) return Result::Err(ErrorCode::ConstraintViolation, "record demon");
    r.id             = s.next_record_id++;
    s.records[r.id] = r;
    return Result::Ok();
  });
}

Result MemoryRepository::UpdateRecord(Connection& c, const model::Record& r) {
  return Write(c, [&](State& s) {
    if (!s.records.contains(r.id)) return Result::Err(ErrorCode::NotFound);
    s.records[r.id] = r;
    return Result::Ok();
  });
}

Result MemoryRepository::DeleteRecord(Connection& c, std::int64_t id) {
  return Write(c, [&](State& s) {
    if (s.records.erase(id) == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  });
}

Result MemoryRepository::PurgeRecordsOfPlayer(Connection& c, std::int64_t player) {
  return Write(c, [&](State& s) {
    for (auto it = s.records.begin(); it != s.records.end();) {
      if (it->second.player != player) {
        ++it;
        continue;
      }
      if (it->second.status == RecordStatus::kSubmitted) {
        it = s.records.erase(it);
        continue;
      }
      it->second.status = RecordStatus::kRejected;
      ++it;
    }
    return Result::Ok();
  });
}

std::vector<model::Record> MemoryRepository::ListRecords(Connection& c, const RecordFilter& filter, const Keyset& keyset) {
  return Read(c, [&](const State& s) {
    return Window(s.records, keyset, [&](const model::Record& r) {
      if (filter.status && r.status != *filter.status) return false;
      if (filter.player && r.player != *filter.player) return false;
      if (filter.demon && r.demon != *filter.demon) return false;
      if (filter.submitter && r.submitter != *filter.submitter) return false;
      return true;
    });
  });
}

// ------------------------------------------------------------------
// Users
// ------------------------------------------------------------------

std::optional<model::User> MemoryRepository::GetUserById(Connection& c, std::int64_t id) {
  return Read(c, [&](const State& s) -> std::optional<model::User> {
    auto it = s.users.find(id);
    if (it == s.users.end()) return std::nullopt;
    return it->second;
  });
}

std::optional<model::User> MemoryRepository::GetUserByName(Connection& c, const std::string& name) {
  return Read(c, [&](const State& s) {
    return FindIf(s.users, [&](const model::User& u) { return u.name == name; });
  });
}

Result MemoryRepository::InsertUser(Connection& c, model::User& r) {
  return Write(c, [&](State& s) {
    if (FindIf(s.users, [&](const model::User& u) { return u.name == r.name; })) {
      return Result::Err(ErrorCode::AlreadyExists, "user name");
    }
    r.id           = s.next_user_id++;
    s.users[r.id] = r;
    return Result::Ok();
  });
}

Result MemoryRepository::UpdateUser(Connection& c, const model::User& r) {
  return Write(c, [&](State& s) {
    if (!s.users.contains(r.id)) return Result::Err(ErrorCode::NotFound);
    s.users[r.id] = r;
    return Result::Ok();
  });
}

Result MemoryRepository::DeleteUser(Connection& c, std::int64_t id) {
  return Write(c, [&](State& s) {
    if (s.users.erase(id) == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  });
}

std::vector<model::User> MemoryRepository::ListUsers(Connection& c, const UserFilter& filter, const Keyset& keyset) {
  return Read(c, [&](const State& s) {
    return Window(s.users, keyset, [&](const model::User& u) {
      if (filter.name && u.name != *filter.name) return false;
      if (filter.display_name && u.display_name != filter.display_name) return false;
      if (!filter.has_permissions.Empty() && !u.permissions.Intersects(filter.has_permissions)) return false;
      return true;
    });
  });
}

} // namespace demonlist::db::memory
