#pragma once

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace market::db::memory {

/*
  Transaction = snapshot + write set

  Commit fails with StorageFailure when another transaction committed
  after this one took its snapshot. Read-only transactions never conflict.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, bool read_only);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }
  bool IsReadOnly() const override {
    return read_only_;
  }

  MemoryRepository::State& Mutable();
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                snapshot_version_ = 0;
  bool                    read_only_        = false;
  bool                    committed_        = false;
  bool                    rolled_back_      = false;
};

} // namespace market::db::memory
