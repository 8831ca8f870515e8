#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace todolist::db::sqlite {

struct SqliteOptions {
  // writers wait this long for a competing lock before failing
  std::uint32_t busy_timeout_ms = 5000;
  bool          wal_mode        = false;
};

/*
  Thin RAII wrapper around one sqlite3* connection.

  The connection is opened in serialized mode and may be shared
  across threads. Transaction state is per connection, so every
  transaction holds TxMutex() for its whole lifetime.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

 private:
  // Busy timeout and journal mode.
  void Configure();

  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
  std::mutex    tx_mutex_;
};

} // namespace todolist::db::sqlite
