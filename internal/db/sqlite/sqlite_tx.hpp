#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace relay::db::sqlite {

/*
  SQLite transaction on the shared connection.

  BEGIN IMMEDIATE takes the write lock up front, so a second process on the
  same file waits (busy_timeout) at Begin instead of failing mid-commit.
  The connection allows one open transaction at a time; OffsetStore
  serializes callers before they get here.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;

 private:
  std::shared_ptr<SqliteDB> db_;
  bool                      finished_ = false;
};

} // namespace relay::db::sqlite
