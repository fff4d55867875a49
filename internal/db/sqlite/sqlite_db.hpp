#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/sql/sql_params.hpp"

namespace demonlist::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/schema/transaction control)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

/*
  Prepared statement owned for the duration of one call.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  Statement& Bind(const sql::Param& param);
  Statement& Bind(const std::string& value);
  Statement& Bind(const std::optional<std::string>& value);

  template <typename... Args>
  Statement& BindAll(const Args&... args) {
    (Bind(args), ...);
    return *this;
  }

  // SQLITE_ROW, SQLITE_DONE or an error code
  int Step();

  std::string                ColText(int col) const;
  std::optional<std::string> ColOptText(int col) const;
  std::int64_t               ColInt64(int col) const;
  int                        ColInt(int col) const;

 private:
  sqlite3*      db_;
  sqlite3_stmt* stmt_ = nullptr;
  int           next_ = 1;
};

} // namespace demonlist::db::sqlite
