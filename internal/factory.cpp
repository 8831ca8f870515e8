#include "factory.hpp"

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"

namespace todolist::factory {

using todolist::observability::BoolField;
using todolist::observability::IntField;
using todolist::observability::StringField;

namespace {

void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS todos (id INTEGER PRIMARY KEY AUTOINCREMENT, title TEXT NOT NULL, completed INTEGER NOT NULL DEFAULT 0);"};

  for (const auto& sql : kBootstrapSql) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT id,title,completed FROM todos LIMIT 1;");
}

db::sqlite::SqliteOptions ResolveSqliteOptions(const todolist::runtime::config::RuntimeConfig& config) {
  db::sqlite::SqliteOptions options;
  const auto&               sqlite = config.database().sqlite();
  options.busy_timeout_ms          = sqlite.busy_timeout_ms() > 0 ? sqlite.busy_timeout_ms() : kDefaultBusyTimeoutMs;
  options.wal_mode                 = sqlite.wal_mode();
  return options;
}

store::RepositoryOpener MakeSqliteOpener(std::string path, db::sqlite::SqliteOptions options) {
  return [path = std::move(path), options]() -> std::shared_ptr<db::Repository> {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path, options);
    BootstrapSqliteSchema(sqlite_db);
    TODOLIST_LOG_INFO("sqlite todo database ready", {StringField("path", path), IntField("busy_timeout_ms", options.busy_timeout_ms),
                                                     BoolField("wal_mode", options.wal_mode)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  };
}

} // namespace

std::string ResolveDatabaseLocation(const todolist::runtime::config::RuntimeConfig& config) {
  if (const char* location = std::getenv(kDatabaseLocationEnv)) {
    if (*location != '\0') {
      return location;
    }
  }

  if (!config.database().sqlite().path().empty()) {
    return config.database().sqlite().path();
  }

  return kDefaultDatabaseLocation;
}

std::shared_ptr<store::TodoStore> BuildStore(const todolist::runtime::config::RuntimeConfig& config) {
  if (config.database().has_memory()) {
    return std::make_shared<store::TodoStore>([]() -> std::shared_ptr<db::Repository> {
      TODOLIST_LOG_INFO("in-memory todo database ready");
      return std::make_shared<db::memory::MemoryRepository>();
    });
  }

  return std::make_shared<store::TodoStore>(MakeSqliteOpener(ResolveDatabaseLocation(config), ResolveSqliteOptions(config)));
}

} // namespace todolist::factory
