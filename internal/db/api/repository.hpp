#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/cursor_record.hpp"
#include "internal/db/model/ledger_record.hpp"

namespace relay::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes happen inside a Transaction
  - Reads inside a transaction see its writes
  - AdvanceCursor never lowers last_update_id
  - InsertLedgerEntry is idempotent on update_id

  The DB is the source of truth for:
    the delivery cursor
    the dedup ledger
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Cursor
  // ---------------------------------------------------------------------

  // *out is nullopt when the cursor row was never written.
  virtual Result GetCursor(Transaction&, std::optional<model::CursorRecord>* out) = 0;

  // Inserts the cursor row or raises last_update_id. A record whose
  // last_update_id is <= the stored value leaves the row untouched.
  virtual Result AdvanceCursor(Transaction&, const model::CursorRecord&) = 0;

  // ---------------------------------------------------------------------
  // Ledger
  // ---------------------------------------------------------------------

  virtual Result HasLedgerEntry(Transaction&, int64_t update_id, bool* found) = 0;

  // A second insert for the same update_id is a no-op returning Ok.
  virtual Result InsertLedgerEntry(Transaction&, const model::LedgerRecord&) = 0;

  virtual Result DeleteLedgerEntriesOlderThan(Transaction&, uint64_t cutoff_ms, uint64_t* deleted) = 0;

  virtual Result CountLedgerEntries(Transaction&, uint64_t* count) = 0;
};

} // namespace relay::db
