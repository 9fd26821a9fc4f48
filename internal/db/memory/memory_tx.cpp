#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace relay::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_          = repo_.committed_;
  snapshot_version_ = repo_.committed_version_;
}

void MemoryTransaction::Commit() {
  if (finished_) {
    throw util::StorageError("memory transaction already finished", ErrorCode::InternalError);
  }
  finished_ = true;
  if (!dirty_) {
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != snapshot_version_) {
    throw util::StorageError("transaction conflict: offsets were modified by a concurrent writer", ErrorCode::Busy);
  }
  repo_.committed_ = std::move(working_);
  repo_.committed_version_++;
}

void MemoryTransaction::Rollback() {
  // Nothing was published; dropping the working copy is enough.
  finished_ = true;
}

} // namespace relay::db::memory
