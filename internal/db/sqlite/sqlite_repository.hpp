#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace relay::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result GetCursor(Transaction&, std::optional<model::CursorRecord>* out) override;
  Result AdvanceCursor(Transaction&, const model::CursorRecord&) override;

  Result HasLedgerEntry(Transaction&, int64_t update_id, bool* found) override;
  Result InsertLedgerEntry(Transaction&, const model::LedgerRecord&) override;
  Result DeleteLedgerEntriesOlderThan(Transaction&, uint64_t cutoff_ms, uint64_t* deleted) override;
  Result CountLedgerEntries(Transaction&, uint64_t* count) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

/*
  Creates the cursor and ledger tables if missing and seeds the cursor
  row with 0. Safe to run on every startup.
*/
void BootstrapSchema(SqliteDB& db);

}
