#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "internal/db/model/cursor_record.hpp"
#include "internal/model/update.hpp"

namespace relay::db {
class Repository;
}

namespace relay::offset {

/*
  Durable delivery cursor + dedup ledger.

  Every operation runs in its own short transaction, and every transaction
  is serialized on mutex_: the sqlite backend shares one connection, and
  concurrent drain / sweep / operator activity must never interleave
  partial writes. All failures surface as util::StorageError; a failed
  operation leaves prior commits intact.
*/
class OffsetStore {
 public:
  explicit OffsetStore(std::shared_ptr<relay::db::Repository> repository);

  // 0 when the cursor was never written.
  int64_t GetLastOffset();

  relay::db::model::CursorRecord GetCursor();

  // No write happens when new_id <= the stored cursor.
  void UpdateOffset(int64_t new_id);

  bool IsProcessed(int64_t update_id);

  // Duplicate inserts are no-ops.
  void MarkProcessed(int64_t update_id, int64_t message_id, int64_t chat_id, const std::string& message_type);

  // Ledger entry + cursor advance for one settled update, as one transaction.
  void CommitResolved(const relay::model::Update& update);

  // Deletes ledger entries processed more than older_than ago.
  uint64_t Prune(std::chrono::milliseconds older_than);

  uint64_t LedgerSize();

 private:
  std::shared_ptr<relay::db::Repository> repository_;
  std::mutex                             mutex_;
};

} // namespace relay::offset
