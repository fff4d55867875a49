#pragma once

namespace demonlist::db {

/*
  Unit of work opened by Connection::Begin().

  Patch persistence, demon reshuffles, submission replacement and the
  player ban cascade each run inside exactly one of these, so a failed
  command leaves no partial rows behind.

  - Commit() publishes every write made through the owning connection
  - Rollback() discards them; a transaction destroyed uncommitted rolls back
  - Commit() on a finished transaction throws util::InvalidState,
    Rollback() on one does nothing

  Backends: BEGIN IMMEDIATE (SQLite), pqxx::work (Postgres), snapshot
  restored on rollback (memory).
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace demonlist::db
