#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/completed.hpp"

namespace todolist::db { class Repository; }

namespace todolist::store {

struct TodoItem {
  std::int64_t id = 0;
  std::string  title;
  bool         completed = false;
};

/*
  Partial update. Absent fields keep their stored value; a
  `completed` that coerces to Unspecified counts as absent.
*/
struct TodoPatch {
  std::optional<std::string> title;
  model::CompletedValue      completed;
};

// Opens the backend and bootstraps its schema. Throws util::ConnectionError.
using RepositoryOpener = std::function<std::shared_ptr<db::Repository>()>;

/*
  TodoStore

  Owns the single lazily-opened repository for the process and
  exposes List / Add / Update / Delete over the `todos` table.

  Initialize() runs the opener at most once per successful open.
  A failed open is not remembered, the next call tries again.
  Every operation initializes implicitly.

  Thread-safe. Share one instance (std::shared_ptr) between all
  consumers instead of opening several.
*/
class TodoStore {
 public:
  explicit TodoStore(RepositoryOpener opener);

  TodoStore(const TodoStore&)            = delete;
  TodoStore& operator=(const TodoStore&) = delete;

  std::shared_ptr<db::Repository> Initialize();
  bool                            IsInitialized() const;

  // Ascending id order.
  std::vector<TodoItem> List();

  // Throws util::ValidationError("title is required") for a blank title.
  TodoItem Add(const std::string& title, const model::CompletedValue& completed = {});

  // false when id is absent or unknown.
  bool Update(std::optional<std::int64_t> id, const TodoPatch& patch);

  // false when no such id.
  bool Delete(std::int64_t id);

 private:
  RepositoryOpener                opener_;
  mutable std::mutex              init_mutex_;
  std::shared_ptr<db::Repository> repository_;
};

} // namespace todolist::store
