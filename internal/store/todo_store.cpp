#include "todo_store.hpp"

#include <stdexcept>
#include <string_view>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace todolist::store {

namespace {

using todolist::observability::IntField;
using todolist::observability::StringField;

void ThrowIfDbError(const db::Result& result, const std::string& prefix) {
  if (result) {
    return;
  }
  throw util::ConnectionError(prefix + ": " + db::ToString(result.code) + ": " + result.message);
}

TodoItem ToItem(const db::model::TodoRecord& record) {
  return TodoItem{record.id, record.title, record.completed == 1};
}

template <typename Fn>
auto ObserveOp(std::string_view op, Fn&& fn) {
  try {
    return fn();
  } catch (const util::ValidationError& ex) {
    TODOLIST_LOG_DEBUG("todo store rejected input", {StringField("op", op), StringField("error", ex.what())});
    throw;
  } catch (const std::exception& ex) {
    TODOLIST_LOG_ERROR("todo store operation failed", {StringField("op", op), StringField("error", ex.what())});
    throw;
  }
}

} // namespace

TodoStore::TodoStore(RepositoryOpener opener) : opener_(std::move(opener)) {
  if (!opener_) {
    throw std::invalid_argument("TodoStore requires a repository opener");
  }
}

std::shared_ptr<db::Repository> TodoStore::Initialize() {
  std::scoped_lock lock(init_mutex_);
  if (repository_) {
    return repository_;
  }

  try {
    auto repository = opener_();
    if (!repository) {
      throw util::ConnectionError("repository opener returned no repository");
    }
    repository_ = std::move(repository);
  } catch (const std::exception& ex) {
    TODOLIST_LOG_ERROR("todo store initialization failed", {StringField("error", ex.what())});
    throw;
  }

  TODOLIST_LOG_INFO("todo store initialized");
  return repository_;
}

bool TodoStore::IsInitialized() const {
  std::scoped_lock lock(init_mutex_);
  return repository_ != nullptr;
}

std::vector<TodoItem> TodoStore::List() {
  return ObserveOp("TodoStore.List", [&] {
    auto repo = Initialize();
    auto tx   = repo->Begin(db::TxMode::ReadOnly);

    std::vector<TodoItem> items;
    for (const auto& record : repo->ListTodos(*tx)) {
      items.push_back(ToItem(record));
    }
    tx->Commit();
    return items;
  });
}

TodoItem TodoStore::Add(const std::string& title, const model::CompletedValue& completed) {
  return ObserveOp("TodoStore.Add", [&] {
    if (util::IsBlank(title)) {
      throw util::ValidationError("title is required");
    }

    db::model::TodoRecord record;
    record.title     = title;
    record.completed = model::ToStoredFlag(model::CoerceCompleted(completed), 0);

    auto repo = Initialize();
    auto tx   = repo->Begin(db::TxMode::ReadWrite);
    ThrowIfDbError(repo->InsertTodo(*tx, record), "insert todo");
    tx->Commit();

    TODOLIST_LOG_DEBUG("todo added", {IntField("id", record.id)});
    return ToItem(record);
  });
}

bool TodoStore::Update(std::optional<std::int64_t> id, const TodoPatch& patch) {
  return ObserveOp("TodoStore.Update", [&] {
    if (patch.title && util::IsBlank(*patch.title)) {
      throw util::ValidationError("title must not be empty");
    }

    auto repo = Initialize();
    if (!id) {
      return false;
    }

    // existence check and write share the write lock
    auto tx       = repo->Begin(db::TxMode::ReadWrite);
    auto existing = repo->GetTodo(*tx, *id);
    if (!existing) {
      return false;
    }

    db::model::TodoRecord next = *existing;
    if (patch.title) {
      next.title = *patch.title;
    }
    next.completed = model::ToStoredFlag(model::CoerceCompleted(patch.completed), existing->completed);

    auto result = repo->UpdateTodo(*tx, next);
    if (result.IsNotFound()) {
      throw util::InconsistentState("todo " + std::to_string(*id) + " vanished inside its update transaction");
    }
    ThrowIfDbError(result, "update todo");
    tx->Commit();
    return true;
  });
}

bool TodoStore::Delete(std::int64_t id) {
  return ObserveOp("TodoStore.Delete", [&] {
    auto repo = Initialize();
    auto tx   = repo->Begin(db::TxMode::ReadWrite);

    auto result = repo->DeleteTodo(*tx, id);
    if (result.IsNotFound()) {
      return false;
    }
    ThrowIfDbError(result, "delete todo");
    tx->Commit();
    return true;
  });
}

} // namespace todolist::store
