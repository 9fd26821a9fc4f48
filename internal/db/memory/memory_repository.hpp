#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>

#include "internal/db/api/repository.hpp"

namespace relay::db::memory {

class MemoryTransaction;

/*
  Process-local backend. Used by tests and when no sqlite path is
  configured; nothing survives a restart.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result GetCursor(Transaction&, std::optional<model::CursorRecord>* out) override;
  Result AdvanceCursor(Transaction&, const model::CursorRecord&) override;

  Result HasLedgerEntry(Transaction&, int64_t update_id, bool* found) override;
  Result InsertLedgerEntry(Transaction&, const model::LedgerRecord&) override;
  Result DeleteLedgerEntriesOlderThan(Transaction&, uint64_t cutoff_ms, uint64_t* deleted) override;
  Result CountLedgerEntries(Transaction&, uint64_t* count) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::optional<model::CursorRecord>    cursor;
    std::map<int64_t, model::LedgerRecord> ledger;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
