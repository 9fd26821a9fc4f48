#pragma once

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace relay::db::memory {

/*
  Private copy of the committed state, published whole on Commit().

  Only a transaction that wrote anything (took Mutable()) can conflict:
  its Commit() fails with Busy if another writer committed after the
  snapshot was taken. Read-only commits are free and bump nothing.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);

  void Commit() override;
  void Rollback() override;

  MemoryRepository::State& Mutable() {
    dirty_ = true;
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                snapshot_version_ = 0;
  bool                    dirty_            = false;
  bool                    finished_         = false;
};

} // namespace relay::db::memory
