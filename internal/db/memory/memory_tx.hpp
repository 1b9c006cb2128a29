#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace relay::db::memory {

/*
  Transaction = snapshot + write set.

  The repository lock is held for the whole transaction, so
  transactions are serialized and Commit never conflicts.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
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
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> lock_;
  MemoryRepository::State      working_;
  bool                         committed_   = false;
  bool                         rolled_back_ = false;
};

} // namespace relay::db::memory
