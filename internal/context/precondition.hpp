#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/db/model/demon.hpp"
#include "internal/db/model/player.hpp"
#include "internal/db/model/record.hpp"
#include "internal/db/model/submitter.hpp"
#include "internal/db/model/user.hpp"

namespace demonlist::context {

/*
  Client-supplied concurrency token, If-Match style.

  Either a list of entity tags or the wildcard, which matches any
  existing entity.
*/
class Precondition {
 public:
  static Precondition Any();
  static Precondition Of(std::vector<std::string> tags);

  // "*" or a comma separated list of (optionally quoted, optionally W/) tags
  static Precondition Parse(std::string_view if_match);

  bool Met(const std::string& tag) const;

  bool IsWildcard() const {
    return wildcard_;
  }

  const std::vector<std::string>& Tags() const {
    return tags_;
  }

 private:
  bool                     wildcard_ = false;
  std::vector<std::string> tags_;
};

// ------------------------------------------------------------------
// Entity tags
//
// Hex SHA-256 over the fields that define an entity's observable state.
// Identical content yields identical tags across processes.
// ------------------------------------------------------------------

std::string Etag(const db::model::Player& player);
std::string Etag(const db::model::Demon& demon);
std::string Etag(const db::model::Submitter& submitter);
std::string Etag(const db::model::Record& record);
std::string Etag(const db::model::User& user);

} // namespace demonlist::context
