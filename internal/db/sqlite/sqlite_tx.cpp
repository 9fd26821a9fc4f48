#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace relay::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) {
    return;
  }
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    RELAY_LOG_WARN("sqlite rollback failed", {relay::observability::StringField("path", db_->Path()),
                                              relay::observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  // A failed COMMIT leaves the transaction open; the destructor rolls it back.
  db_->Exec("COMMIT;");
  finished_ = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace relay::db::sqlite
