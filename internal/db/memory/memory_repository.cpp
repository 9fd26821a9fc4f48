#include "memory_repository.hpp"

#include "internal/util/time.hpp"
#include "memory_tx.hpp"

namespace relay::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::GetCursor(Transaction& t, std::optional<model::CursorRecord>* out) {
  *out = TX(t).View().cursor;
  return Result::Ok();
}

Result MemoryRepository::AdvanceCursor(Transaction& t, const model::CursorRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.cursor.has_value()) {
    model::CursorRecord created = r;
    if (created.created_at_ms == 0) created.created_at_ms = util::ToUnixMillis(util::Now());
    s.cursor = created;
    return Result::Ok();
  }
  if (r.last_update_id <= s.cursor->last_update_id) return Result::Ok();

  s.cursor->last_update_id         = r.last_update_id;
  s.cursor->last_processed_time_ms = r.last_processed_time_ms;
  return Result::Ok();
}

Result MemoryRepository::HasLedgerEntry(Transaction& t, int64_t update_id, bool* found) {
  *found = TX(t).View().ledger.contains(update_id);
  return Result::Ok();
}

Result MemoryRepository::InsertLedgerEntry(Transaction& t, const model::LedgerRecord& r) {
  TX(t).Mutable().ledger.emplace(r.update_id, r);
  return Result::Ok();
}

Result MemoryRepository::DeleteLedgerEntriesOlderThan(Transaction& t, uint64_t cutoff_ms, uint64_t* deleted) {
  auto&    ledger = TX(t).Mutable().ledger;
  uint64_t count  = 0;
  for (auto it = ledger.begin(); it != ledger.end();) {
    if (it->second.processed_time_ms < cutoff_ms) {
      it = ledger.erase(it);
      ++count;
    } else {
      ++it;
    }
  }
  *deleted = count;
  return Result::Ok();
}

Result MemoryRepository::CountLedgerEntries(Transaction& t, uint64_t* count) {
  *count = TX(t).View().ledger.size();
  return Result::Ok();
}

} // namespace relay::db::memory
