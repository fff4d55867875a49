#pragma once

#include <memory>
#include <string>

#include "internal/db/api/connection.hpp"
#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace demonlist::db::sqlite {

/*
  Pooled sqlite3 handle. Statements run in autocommit mode unless a
  transaction returned by Begin() is open.
*/
class SqliteConnection final : public db::Connection {
 public:
  explicit SqliteConnection(std::shared_ptr<SqliteDB> db);

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Exec(const std::string& sql) {
    db_->Exec(sql);
  }

  bool IsHealthy() const override;

  std::unique_ptr<Transaction> Begin() override;

  bool InTransaction() const override {
    return in_transaction_;
  }

 private:
  friend class SqliteTransaction;

  std::shared_ptr<SqliteDB> db_;
  bool                      in_transaction_ = false;
};

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(SqliteConnection& conn);
  ~SqliteTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  SqliteConnection& conn_;
  bool              committed_ = false;
  bool              finished_  = false;
};

} // namespace demonlist::db::sqlite
