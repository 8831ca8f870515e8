#pragma once

#include <memory>
#include <string>

#include "config/config.pb.h"

#include "internal/store/todo_store.hpp"

namespace todolist::factory {

inline constexpr const char* kDefaultDatabaseLocation = "/etc/todos/todo.db";
inline constexpr const char* kDatabaseLocationEnv     = "SQLITE_DB_LOCATION";
inline constexpr unsigned    kDefaultBusyTimeoutMs    = 5000;

/*
  Database file location:
    SQLITE_DB_LOCATION env > database.sqlite.path > /etc/todos/todo.db
*/
std::string ResolveDatabaseLocation(const todolist::runtime::config::RuntimeConfig& config);

/*
  BuildStore

  Composition root. The ONLY place allowed to know concrete DB types.
  Nothing is opened here; the store connects on first use.
*/
std::shared_ptr<store::TodoStore> BuildStore(const todolist::runtime::config::RuntimeConfig& config);

} // namespace todolist::factory
