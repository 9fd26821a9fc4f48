#include "internal/offset/offset_store.hpp"

#include <optional>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace relay::offset {

using relay::observability::DurationField;
using relay::observability::IntField;
using relay::util::ThrowIfDbError;

namespace {

// Read-only operations never commit; the transaction rolls back on scope exit.
//
// Repository::Begin and Commit may throw StorageError themselves (lock
// timeouts, I/O); anything else from the backend is wrapped here so callers
// only ever see StorageError.
template <typename Fn>
auto WithStorageErrors(const char* context, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const util::StorageError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::StorageError(std::string(context) + ": " + e.what());
  }
}

} // namespace

OffsetStore::OffsetStore(std::shared_ptr<relay::db::Repository> repository) : repository_(std::move(repository)) {
}

int64_t OffsetStore::GetLastOffset() {
  return GetCursor().last_update_id;
}

relay::db::model::CursorRecord OffsetStore::GetCursor() {
  std::lock_guard lock(mutex_);
  return WithStorageErrors("get cursor", [&] {
    auto tx = repository_->Begin();

    std::optional<relay::db::model::CursorRecord> cursor;
    ThrowIfDbError(repository_->GetCursor(*tx, &cursor), "get cursor");

    return cursor.value_or(relay::db::model::CursorRecord{});
  });
}

void OffsetStore::UpdateOffset(int64_t new_id) {
  std::lock_guard lock(mutex_);
  WithStorageErrors("update offset", [&] {
    auto tx = repository_->Begin();

    relay::db::model::CursorRecord record;
    record.last_update_id         = new_id;
    record.last_processed_time_ms = util::ToUnixMillis(util::Now());
    ThrowIfDbError(repository_->AdvanceCursor(*tx, record), "update offset");
    tx->Commit();
  });
  RELAY_LOG_DEBUG("offset updated", {IntField("update_id", new_id)});
}

bool OffsetStore::IsProcessed(int64_t update_id) {
  std::lock_guard lock(mutex_);
  return WithStorageErrors("is processed", [&] {
    auto tx    = repository_->Begin();
    bool found = false;
    ThrowIfDbError(repository_->HasLedgerEntry(*tx, update_id, &found), "is processed");
    return found;
  });
}

void OffsetStore::MarkProcessed(int64_t update_id, int64_t message_id, int64_t chat_id, const std::string& message_type) {
  std::lock_guard lock(mutex_);
  WithStorageErrors("mark processed", [&] {
    auto tx = repository_->Begin();

    relay::db::model::LedgerRecord record;
    record.update_id         = update_id;
    record.message_id        = message_id;
    record.chat_id           = chat_id;
    record.processed_time_ms = util::ToUnixMillis(util::Now());
    record.message_type      = message_type;
    ThrowIfDbError(repository_->InsertLedgerEntry(*tx, record), "mark processed");
    tx->Commit();
  });
  RELAY_LOG_DEBUG("update marked processed", {IntField("update_id", update_id)});
}

void OffsetStore::CommitResolved(const relay::model::Update& update) {
  std::lock_guard lock(mutex_);
  WithStorageErrors("commit resolved", [&] {
    const auto now_ms = util::ToUnixMillis(util::Now());
    auto       tx     = repository_->Begin();

    relay::db::model::LedgerRecord entry;
    entry.update_id         = update.id;
    entry.message_id        = update.message_id;
    entry.chat_id           = update.chat_id;
    entry.processed_time_ms = now_ms;
    entry.message_type      = update.kind;
    ThrowIfDbError(repository_->InsertLedgerEntry(*tx, entry), "commit resolved: ledger");

    relay::db::model::CursorRecord cursor;
    cursor.last_update_id         = update.id;
    cursor.last_processed_time_ms = now_ms;
    ThrowIfDbError(repository_->AdvanceCursor(*tx, cursor), "commit resolved: cursor");

    tx->Commit();
  });
}

uint64_t OffsetStore::Prune(std::chrono::milliseconds older_than) {
  std::lock_guard lock(mutex_);
  const auto      deleted = WithStorageErrors("prune", [&] {
    const auto cutoff_ms = util::CutoffMillis(util::Now(), older_than);
    auto       tx        = repository_->Begin();
    uint64_t   count     = 0;
    ThrowIfDbError(repository_->DeleteLedgerEntriesOlderThan(*tx, cutoff_ms, &count), "prune");
    tx->Commit();
    return count;
  });
  RELAY_LOG_INFO("ledger pruned", {IntField("deleted", static_cast<int64_t>(deleted)),
                                   DurationField("older_than", older_than)});
  return deleted;
}

uint64_t OffsetStore::LedgerSize() {
  std::lock_guard lock(mutex_);
  return WithStorageErrors("ledger size", [&] {
    auto     tx    = repository_->Begin();
    uint64_t count = 0;
    ThrowIfDbError(repository_->CountLedgerEntries(*tx, &count), "ledger size");
    return count;
  });
}

} // namespace relay::offset
