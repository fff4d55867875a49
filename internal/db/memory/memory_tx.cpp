#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace demonlist::db::memory {

MemoryConnection::MemoryConnection(MemoryRepository& repo, std::shared_ptr<MemoryRepository::Slot> slot) : repo_(repo), slot_(std::move(slot)) {
}

std::unique_ptr<db::Transaction> MemoryConnection::Begin() {
  if (active_) {
    throw util::InvalidState("connection already has an open transaction");
  }
  return std::make_unique<MemoryTransaction>(*this);
}

MemoryTransaction::MemoryTransaction(MemoryConnection& conn) : conn_(conn), writer_(conn.repo_.writer_mutex_) {
  {
    std::scoped_lock lock(conn_.repo_.state_mutex_);
    working_ = conn_.repo_.committed_; // snapshot copy
  }
  conn_.active_ = this;
  conn_.repo_.transactions_begun_++;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw util::InvalidState("transaction already finished");
  }
  {
    std::scoped_lock lock(conn_.repo_.state_mutex_);
    conn_.repo_.committed_ = std::move(working_);
  }
  committed_ = true;
  Finish();
}

void MemoryTransaction::Rollback() {
  if (committed_ || rolled_back_) return;
  rolled_back_ = true;
  Finish();
}

void MemoryTransaction::Finish() {
  conn_.active_ = nullptr;
  if (writer_.owns_lock()) writer_.unlock();
}

} // namespace demonlist::db::memory
