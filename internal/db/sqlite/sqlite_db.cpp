#include "sqlite_db.hpp"

#include <algorithm>
#include <limits>

#include "internal/util/errors.hpp"

namespace todolist::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw util::ConnectionError(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)), options_(options) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::ConnectionError("open " + path_ + ": " + msg);
  }

  try {
    Configure();
  } catch (...) {
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
    throw util::ConnectionError(msg);
  }
}

void SqliteDB::Configure() {
  // wait for locks instead of failing immediately; clamped, since a
  // negative value would disable the handler
  const auto timeout_ms = std::min<std::uint32_t>(options_.busy_timeout_ms, static_cast<std::uint32_t>(std::numeric_limits<int>::max()));
  ThrowIf(sqlite3_busy_timeout(db_, static_cast<int>(timeout_ms)), db_, "busy_timeout");

  // WAL lets readers proceed while a writer holds the lock
  if (options_.wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");
  }
}

} // namespace todolist::db::sqlite
