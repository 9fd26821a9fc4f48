#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <string>
#include <vector>

namespace relay::db::sqlite {

using relay::db::ErrorCode;
using relay::db::Result;

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

// 0 means "not attached" for message/chat ids.
static void BindI64OrNull(sqlite3_stmt* st, int idx, int64_t v) {
    if (v == 0) {
        sqlite3_bind_null(st, idx);
    } else {
        BindI64(st, idx, v);
    }
}

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

void BootstrapSchema(SqliteDB& db) {
    static const std::vector<std::string> kBootstrapSql = {
        "CREATE TABLE IF NOT EXISTS cursor (id INTEGER PRIMARY KEY CHECK (id = 1), last_update_id INTEGER NOT NULL, last_processed_time INTEGER, created_at INTEGER NOT NULL DEFAULT (unixepoch() * 1000));",
        "CREATE TABLE IF NOT EXISTS ledger (update_id INTEGER PRIMARY KEY, message_id INTEGER, chat_id INTEGER, processed_time INTEGER NOT NULL, message_type TEXT);",
        "CREATE INDEX IF NOT EXISTS ledger_processed_time_idx ON ledger(processed_time);",
        "INSERT OR IGNORE INTO cursor(id,last_update_id) VALUES(1,0);"};

    for (const auto& sql : kBootstrapSql) {
        db.Exec(sql);
    }

    db.Exec("SELECT id,last_update_id,last_processed_time,created_at FROM cursor LIMIT 1;");
    db.Exec("SELECT update_id,message_id,chat_id,processed_time,message_type FROM ledger LIMIT 1;");
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_READONLY:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Cursor
// ------------------------------------------------------------------

Result SqliteRepository::GetCursor(Transaction& t, std::optional<model::CursorRecord>* out) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT last_update_id,COALESCE(last_processed_time,0),created_at FROM cursor WHERE id=1;";

    sqlite3_stmt* st = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &st, nullptr);
    if (rc != SQLITE_OK)
        return Translate(db, rc);

    rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) {
        model::CursorRecord r;
        r.last_update_id = ColI64(st, 0);
        r.last_processed_time_ms = ColU64(st, 1);
        r.created_at_ms = ColU64(st, 2);
        *out = r;
    } else {
        out->reset();
    }

    sqlite3_finalize(st);
    return Translate(db, rc);
}

Result SqliteRepository::AdvanceCursor(Transaction& t, const model::CursorRecord& r) {
    auto* db = TX(t).Handle();

    // The WHERE on the upsert makes a stale or equal id a no-op.
    const char* sql =
        "INSERT INTO cursor(id,last_update_id,last_processed_time) VALUES(1,?,?) "
        "ON CONFLICT(id) DO UPDATE SET "
        "last_update_id=excluded.last_update_id, last_processed_time=excluded.last_processed_time "
        "WHERE excluded.last_update_id > cursor.last_update_id;";

    sqlite3_stmt* st = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &st, nullptr);
    if (rc != SQLITE_OK)
        return Translate(db, rc);

    BindI64(st, 1, r.last_update_id);
    BindU64(st, 2, r.last_processed_time_ms);

    rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result SqliteRepository::HasLedgerEntry(Transaction& t, int64_t update_id, bool* found) {
    auto* db = TX(t).Handle();

    const char* sql = "SELECT 1 FROM ledger WHERE update_id=?;";

    sqlite3_stmt* st = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &st, nullptr);
    if (rc != SQLITE_OK)
        return Translate(db, rc);

    BindI64(st, 1, update_id);

    rc = sqlite3_step(st);
    *found = rc == SQLITE_ROW;

    sqlite3_finalize(st);
    return Translate(db, rc);
}

Result SqliteRepository::InsertLedgerEntry(Transaction& t, const model::LedgerRecord& r) {
    auto* db = TX(t).Handle();

    // OR IGNORE: the first outcome recorded for an update wins.
    const char* sql =
        "INSERT OR IGNORE INTO ledger(update_id,message_id,chat_id,processed_time,message_type) "
        "VALUES(?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &st, nullptr);
    if (rc != SQLITE_OK)
        return Translate(db, rc);

    BindI64(st, 1, r.update_id);
    BindI64OrNull(st, 2, r.message_id);
    BindI64OrNull(st, 3, r.chat_id);
    BindU64(st, 4, r.processed_time_ms);
    BindText(st, 5, r.message_type);

    rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

Result SqliteRepository::DeleteLedgerEntriesOlderThan(Transaction& t, uint64_t cutoff_ms, uint64_t* deleted) {
    auto* db = TX(t).Handle();

    const char* sql = "DELETE FROM ledger WHERE processed_time < ?;";

    sqlite3_stmt* st = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &st, nullptr);
    if (rc != SQLITE_OK)
        return Translate(db, rc);

    BindU64(st, 1, cutoff_ms);

    rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE)
        return Translate(db, rc);

    *deleted = static_cast<uint64_t>(sqlite3_changes(db));
    return Result::Ok();
}

Result SqliteRepository::CountLedgerEntries(Transaction& t, uint64_t* count) {
    auto* db = TX(t).Handle();

    const char* sql = "SELECT COUNT(*) FROM ledger;";

    sqlite3_stmt* st = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &st, nullptr);
    if (rc != SQLITE_OK)
        return Translate(db, rc);

    rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) {
        *count = ColU64(st, 0);
    }

    sqlite3_finalize(st);
    return Translate(db, rc);
}

} // namespace relay::db::sqlite
