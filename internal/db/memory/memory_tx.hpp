#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/connection.hpp"
#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace demonlist::db::memory {

class MemoryConnection final : public db::Connection {
 public:
  MemoryConnection(MemoryRepository& repo, std::shared_ptr<MemoryRepository::Slot> slot);

  bool IsHealthy() const override {
    return true;
  }

  std::unique_ptr<Transaction> Begin() override;

  bool InTransaction() const override {
    return active_ != nullptr;
  }

  MemoryTransaction* Active() const {
    return active_;
  }

 private:
  friend class MemoryTransaction;

  MemoryRepository&                       repo_;
  std::shared_ptr<MemoryRepository::Slot> slot_;
  MemoryTransaction*                      active_ = nullptr;
};

/*
  Transaction = writer lock + private copy of the committed state
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryConnection& conn);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  void Finish();

  MemoryConnection&            conn_;
  std::unique_lock<std::mutex> writer_;
  MemoryRepository::State      working_;
  bool                         committed_   = false;
  bool                         rolled_back_ = false;
};

} // namespace demonlist::db::memory
