#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace demonlist::db::postgres {

PgConnection::PgConnection(std::shared_ptr<pqxx::connection> conn) : conn_(std::move(conn)) {
}

std::unique_ptr<db::Transaction> PgConnection::Begin() {
  if (active_) {
    throw util::InvalidState("connection already has an open transaction");
  }
  return std::make_unique<PgTransaction>(*this);
}

pqxx::work* PgConnection::ActiveWork() {
  return active_ ? &active_->Work() : nullptr;
}

PgTransaction::PgTransaction(PgConnection& conn) : conn_(conn) {
  try {
    tx_ = std::make_unique<pqxx::work>(conn_.Raw());
  } catch (const std::exception& e) {
    throw util::DatabaseError(std::string("begin: ") + e.what());
  }
  conn_.active_ = this;
}

PgTransaction::~PgTransaction() {
  if (finished_) return;
  try {
    Rollback();
  } catch (const std::exception& e) {
    DEMONLIST_LOG_WARN("postgres rollback failed", observability::StringField("error", e.what()));
  }
}

void PgTransaction::Commit() {
  if (finished_) {
    throw util::InvalidState("transaction already finished");
  }
  finished_     = true;
  conn_.active_ = nullptr;
  try {
    tx_->commit();
  } catch (const std::exception& e) {
    throw util::DatabaseError(std::string("commit: ") + e.what());
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  if (finished_) return;
  finished_     = true;
  conn_.active_ = nullptr;
  tx_->abort();
}

} // namespace demonlist::db::postgres
