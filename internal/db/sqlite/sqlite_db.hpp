#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace relay::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  Failures surface as util::StorageError.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/schema/transaction control)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace relay::db::sqlite
