#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/model/completed.hpp"
#include "internal/util/errors.hpp"

namespace todolist::db::sqlite {

using todolist::db::ErrorCode;
using todolist::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    // explicit length: titles may carry embedded NULs
    sqlite3_bind_text(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    if (!t) return {};
    return std::string(reinterpret_cast<const char*>(t), static_cast<size_t>(sqlite3_column_bytes(st, col)));
}

static std::int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<std::int64_t>(sqlite3_column_int64(st, col));
}

// Rows written by older tools may hold "true"/"false" text.
static int ColCompleted(sqlite3_stmt* st, int col) {
    switch (sqlite3_column_type(st, col)) {
        case SQLITE_INTEGER:
            return sqlite3_column_int64(st, col) == 1 ? 1 : 0;
        case SQLITE_TEXT:
            return ::todolist::model::CoerceCompletedText(ColText(st, col)) == ::todolist::model::Coerced::True ? 1 : 0;
        default:
            return 0;
    }
}

static model::TodoRecord ReadRow(sqlite3_stmt* st) {
    model::TodoRecord r;
    r.id = ColI64(st, 0);
    r.title = ColText(st, 1);
    r.completed = ColCompleted(st, 2);
    return r;
}

[[noreturn]] static void ThrowRead(sqlite3* db, const char* what) {
    throw util::ConnectionError(std::string(what) + ": " + sqlite3_errmsg(db));
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin(TxMode mode) {
    return std::make_unique<SqliteTransaction>(db_, mode);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_CANTOPEN:
        case SQLITE_FULL:
        case SQLITE_READONLY:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Todos
// ------------------------------------------------------------------

Result SqliteRepository::InsertTodo(Transaction& t, model::TodoRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql = "INSERT INTO todos(title,completed) VALUES(?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.title);
    BindI32(st, 2, r.completed);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (result) {
        // valid while the transaction holds the connection
        r.id = static_cast<std::int64_t>(sqlite3_last_insert_rowid(db));
    }
    return result;
}

std::optional<model::TodoRecord>
SqliteRepository::GetTodo(Transaction& t, std::int64_t id) {
    auto* db = TX(t).Handle();

    const char* sql = "SELECT id,title,completed FROM todos WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        ThrowRead(db, "select todo");

    BindI64(st, 1, id);

    int rc = sqlite3_step(st);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(st);
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        ThrowRead(db, "select todo");
    }

    auto r = ReadRow(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::TodoRecord> SqliteRepository::ListTodos(Transaction& t) {
    auto* db = TX(t).Handle();

    const char* sql = "SELECT id,title,completed FROM todos ORDER BY id ASC;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        ThrowRead(db, "list todos");

    std::vector<model::TodoRecord> out;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ReadRow(st));
    }
    sqlite3_finalize(st);

    if (rc != SQLITE_DONE)
        ThrowRead(db, "list todos");

    return out;
}

Result SqliteRepository::UpdateTodo(Transaction& t, const model::TodoRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql = "UPDATE todos SET title=?,completed=? WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.title);
    BindI32(st, 2, r.completed);
    BindI64(st, 3, r.id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "todo not found");
    return result;
}

Result SqliteRepository::DeleteTodo(Transaction& t, std::int64_t id) {
    auto* db = TX(t).Handle();

    const char* sql = "DELETE FROM todos WHERE id=?;";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st, 1, id);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "todo not found");
    return result;
}

} // namespace todolist::db::sqlite
