#include "sqlite_db.hpp"

#include <filesystem>

#include "internal/util/errors.hpp"

namespace relay::db::sqlite {

namespace {

ErrorCode CodeFor(int rc) {
  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return ErrorCode::Busy;
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
    case SQLITE_FULL:
    case SQLITE_READONLY:
      return ErrorCode::IOError;
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return ErrorCode::Corruption;
    default:
      return ErrorCode::InternalError;
  }
}

void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw util::StorageError(std::string(what) + ": " + sqlite3_errmsg(db), CodeFor(rc));
  }
}

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  // Default path lives under data/, which may not exist yet.
  const auto parent = std::filesystem::path(path_).parent_path();
  if (!parent.empty() && path_ != ":memory:") {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw util::StorageError("sqlite create directory " + parent.string() + ": " + ec.message(), ErrorCode::IOError);
    }
  }

  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StorageError("sqlite open " + path_ + ": " + msg, CodeFor(rc));
  }

  try {
    Configure();
  } catch (const util::StorageError&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw util::StorageError(msg, CodeFor(rc));
  }
}

void SqliteDB::Configure() {
  // IMPORTANT: WAL enables concurrent readers while writer holds lock
  Exec("PRAGMA journal_mode=WAL;");

  // FULL: a committed cursor must survive power loss, not just a process crash
  Exec("PRAGMA synchronous=FULL;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace relay::db::sqlite
