#pragma once

#include <cstdint>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace foreman::db::memory {

/*
  Transaction = snapshot + write set.

  Transactions are serialized on the repository's writer lock; Commit
  still refuses a snapshot that is older than the committed state.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

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
  std::unique_lock<std::mutex> writer_lock_;
  MemoryRepository::State      working_;
  uint64_t                     snapshot_version_ = 0;
  bool                         committed_        = false;
  bool                         rolled_back_      = false;
};

} // namespace foreman::db::memory
