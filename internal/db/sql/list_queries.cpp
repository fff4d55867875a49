#include "list_queries.hpp"

#include <utility>

namespace demonlist::db::sql {

namespace {

class WhereBuilder {
 public:
  void Add(const char* condition, Param param) {
    clause_ += clause_.empty() ? " WHERE " : " AND ";
    clause_ += condition;
    params_.push_back(std::move(param));
  }

  Query Finish(const char* select, const Keyset& keyset) {
    if (keyset.after) Add("id>?", *keyset.after);
    if (keyset.before) Add("id<?", *keyset.before);

    Query query;
    query.text = std::string(select) + clause_ + (keyset.descending ? " ORDER BY id DESC" : " ORDER BY id ASC") +
                 " LIMIT " + std::to_string(keyset.limit) + ";";
    query.params = std::move(params_);
    return query;
  }

 private:
  std::string clause_;
  Params      params_;
};

} // namespace

std::string ToDollarPlaceholders(const std::string& sql) {
  std::string out;
  out.reserve(sql.size() + 16);

  int  index     = 0;
  bool in_string = false;
  for (char c : sql) {
    if (c == '\'') in_string = !in_string;
    if (c == '?' && !in_string) {
      out += '$';
      out += std::to_string(++index);
      continue;
    }
    out += c;
  }
  return out;
}

Query BuildPlayerListQuery(const PlayerFilter& filter, const Keyset& keyset) {
  WhereBuilder where;
  if (filter.name) where.Add("name=?", *filter.name);
  if (filter.banned) where.Add("banned=?", *filter.banned);
  return where.Finish("SELECT id,name,banned FROM players", keyset);
}

Query BuildRecordListQuery(const RecordFilter& filter, const Keyset& keyset) {
  WhereBuilder where;
  if (filter.status) where.Add("status=?", static_cast<std::int32_t>(*filter.status));
  if (filter.player) where.Add("player=?", *filter.player);
  if (filter.demon) where.Add("demon=?", *filter.demon);
  if (filter.submitter) where.Add("submitter=?", *filter.submitter);
  return where.Finish("SELECT id,progress,video,status,player,submitter,demon FROM records", keyset);
}

Query BuildUserListQuery(const UserFilter& filter, const Keyset& keyset) {
  WhereBuilder where;
  if (filter.name) where.Add("name=?", *filter.name);
  if (filter.display_name) where.Add("display_name=?", *filter.display_name);
  if (!filter.has_permissions.Empty()) {
    where.Add("(permissions & ?) <> 0", static_cast<std::int32_t>(filter.has_permissions.Bits()));
  }
  return where.Finish("SELECT id,name,display_name,youtube_channel,password_hash,permissions FROM users", keyset);
}

} // namespace demonlist::db::sql
