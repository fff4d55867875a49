#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace demonlist::db::sqlite {

SqliteConnection::SqliteConnection(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

bool SqliteConnection::IsHealthy() const {
  return db_ && db_->Handle() != nullptr;
}

std::unique_ptr<db::Transaction> SqliteConnection::Begin() {
  if (in_transaction_) {
    throw util::InvalidState("connection already has an open transaction");
  }
  return std::make_unique<SqliteTransaction>(*this);
}

SqliteTransaction::SqliteTransaction(SqliteConnection& conn) : conn_(conn) {
  conn_.db_->Exec("BEGIN IMMEDIATE;");
  conn_.in_transaction_ = true;
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    Rollback();
  } catch (const std::exception& e) {
    DEMONLIST_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (finished_) {
    throw util::InvalidState("transaction already finished");
  }
  conn_.db_->Exec("COMMIT;");
  committed_            = true;
  finished_             = true;
  conn_.in_transaction_ = false;
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  finished_             = true;
  conn_.in_transaction_ = false;
  conn_.db_->Exec("ROLLBACK;");
}

} // namespace demonlist::db::sqlite
