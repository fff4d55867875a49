#pragma once

#include "internal/db/api/types.hpp"
#include "internal/db/sql/sql_params.hpp"

namespace demonlist::db::sql {

/*
  Keyset listing queries.

  Each builder emits
    SELECT <columns> FROM <table> WHERE <filters> AND id>? AND id<?
    ORDER BY id ASC|DESC LIMIT n
  with `?` placeholders, in the column order of the matching
  SELECT_*_BY_ID statement.
*/

Query BuildPlayerListQuery(const PlayerFilter& filter, const Keyset& keyset);

Query BuildRecordListQuery(const RecordFilter& filter, const Keyset& keyset);

Query BuildUserListQuery(const UserFilter& filter, const Keyset& keyset);

} // namespace demonlist::db::sql
