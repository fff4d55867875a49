#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace demonlist::db::sql {

/*
  Parameter abstraction.

  Postgres: $1 $2 $3
  SQLite:   ? ? ?

  Both use ordered binding, so one list of params serves both engines.
*/

using Param = std::variant<std::nullptr_t, bool, std::int32_t, std::int64_t, std::string>;

using Params = std::vector<Param>;

/*
  Statement text plus the params bound to its placeholders, in order.
*/
struct Query {
  std::string text;
  Params      params;
};

// Rewrites SQLite style `?` placeholders into Postgres `$1..$n`.
std::string ToDollarPlaceholders(const std::string& sql);

} // namespace demonlist::db::sql
