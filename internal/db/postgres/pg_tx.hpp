#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/connection.hpp"
#include "internal/db/api/transaction.hpp"

namespace demonlist::db::postgres {

class PgTransaction;

/*
  Pooled libpqxx connection. libpqxx allows one transaction object per
  connection at a time: statements outside Begin() run in their own
  pqxx::nontransaction.
*/
class PgConnection final : public db::Connection {
 public:
  explicit PgConnection(std::shared_ptr<pqxx::connection> conn);

  bool IsHealthy() const override {
    return conn_ && conn_->is_open();
  }

  std::unique_ptr<Transaction> Begin() override;

  bool InTransaction() const override {
    return active_ != nullptr;
  }

  pqxx::connection& Raw() {
    return *conn_;
  }

  // Work of the open transaction, nullptr in autocommit mode.
  pqxx::work* ActiveWork();

 private:
  friend class PgTransaction;

  std::shared_ptr<pqxx::connection> conn_;
  PgTransaction*                    active_ = nullptr;
};

class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(PgConnection& conn);
  ~PgTransaction();

  pqxx::work& Work() {
    return *tx_;
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  PgConnection&               conn_;
  std::unique_ptr<pqxx::work> tx_;
  bool                        committed_ = false;
  bool                        finished_  = false;
};

} // namespace demonlist::db::postgres
