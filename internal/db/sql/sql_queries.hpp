#pragma once

namespace demonlist::db::sql {

/*
  Canonical SQL used by all backends.

  IMPORTANT:
  These are written in SQLite-compatible SQL subset
  so they work in both engines. Postgres rewrites the
  placeholders with ToDollarPlaceholders() and appends
  RETURNING to inserts that generate an id.
*/

// players

static constexpr const char* SELECT_PLAYER_BY_ID =
    "SELECT id,name,banned FROM players WHERE id=?;";

static constexpr const char* SELECT_PLAYER_BY_NAME =
    "SELECT id,name,banned FROM players WHERE name=?;";

static constexpr const char* INSERT_PLAYER =
    "INSERT INTO players(name,banned) VALUES(?,?)";

static constexpr const char* UPDATE_PLAYER =
    "UPDATE players SET name=?,banned=? WHERE id=?;";

// demons

static constexpr const char* SELECT_DEMON_BY_NAME =
    "SELECT name,position,requirement,video,verifier,publisher"
    " FROM demons WHERE name=?;";

static constexpr const char* INSERT_DEMON =
    "INSERT INTO demons(name,position,requirement,video,verifier,publisher)"
    " VALUES(?,?,?,?,?,?);";

// records follow a rename through ON UPDATE CASCADE
static constexpr const char* UPDATE_DEMON =
    "UPDATE demons SET name=?,requirement=?,video=?,verifier=?,publisher=?"
    " WHERE name=?;";

static constexpr const char* SELECT_DEMON_POSITION =
    "SELECT position FROM demons WHERE name=?;";

// moving down the list (from < to); params: from, to, name
static constexpr const char* SHIFT_DEMONS_UP =
    "UPDATE demons SET position=position-1"
    " WHERE position>? AND position<=? AND name<>?;";

// moving up the list (to < from); params: to, from, name
static constexpr const char* SHIFT_DEMONS_DOWN =
    "UPDATE demons SET position=position+1"
    " WHERE position>=? AND position<? AND name<>?;";

static constexpr const char* SET_DEMON_POSITION =
    "UPDATE demons SET position=? WHERE name=?;";

static constexpr const char* SELECT_MAX_DEMON_POSITION =
    "SELECT COALESCE(MAX(position),0) FROM demons;";

// submitters

static constexpr const char* SELECT_SUBMITTER_BY_ID =
    "SELECT id,ip,banned FROM submitters WHERE id=?;";

static constexpr const char* SELECT_SUBMITTER_BY_IP =
    "SELECT id,ip,banned FROM submitters WHERE ip=?;";

static constexpr const char* INSERT_SUBMITTER =
    "INSERT INTO submitters(ip,banned) VALUES(?,?)";

static constexpr const char* UPDATE_SUBMITTER =
    "UPDATE submitters SET ip=?,banned=? WHERE id=?;";

// records

static constexpr const char* SELECT_RECORD_BY_ID =
    "SELECT id,progress,video,status,player,submitter,demon"
    " FROM records WHERE id=?;";

// params: player, demon, video (NULL never matches)
static constexpr const char* SELECT_MATCHING_RECORDS =
    "SELECT id,progress,video,status,player,submitter,demon FROM records"
    " WHERE (player=? AND demon=?) OR video=?"
    " ORDER BY CASE status WHEN 2 THEN 0 ELSE 1 END, progress DESC, id ASC;";

static constexpr const char* INSERT_RECORD =
    "INSERT INTO records(progress,video,status,player,submitter,demon)"
    " VALUES(?,?,?,?,?,?)";

static constexpr const char* UPDATE_RECORD =
    "UPDATE records SET progress=?,video=?,status=?,player=?,submitter=?,demon=?"
    " WHERE id=?;";

static constexpr const char* DELETE_RECORD =
    "DELETE FROM records WHERE id=?;";

static constexpr const char* DELETE_SUBMITTED_RECORDS_OF_PLAYER =
    "DELETE FROM records WHERE player=? AND status=0;";

static constexpr const char* REJECT_RECORDS_OF_PLAYER =
    "UPDATE records SET status=2 WHERE player=?;";

// users

static constexpr const char* SELECT_USER_BY_ID =
    "SELECT id,name,display_name,youtube_channel,password_hash,permissions"
    " FROM users WHERE id=?;";

static constexpr const char* SELECT_USER_BY_NAME =
    "SELECT id,name,display_name,youtube_channel,password_hash,permissions"
    " FROM users WHERE name=?;";

static constexpr const char* INSERT_USER =
    "INSERT INTO users(name,display_name,youtube_channel,password_hash,permissions)"
    " VALUES(?,?,?,?,?)";

static constexpr const char* UPDATE_USER =
    "UPDATE users SET name=?,display_name=?,youtube_channel=?,password_hash=?,permissions=?"
    " WHERE id=?;";

static constexpr const char* DELETE_USER =
    "DELETE FROM users WHERE id=?;";

} // namespace demonlist::db::sql
