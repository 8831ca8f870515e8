#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/todo_record.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"

namespace {

using todolist::db::ErrorCode;
using todolist::db::Repository;
using todolist::db::TxMode;
using todolist::db::memory::MemoryRepository;
using todolist::db::model::TodoRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

TodoRecord MakeTodo(const std::string& title, int completed = 0) {
  TodoRecord record;
  record.title     = title;
  record.completed = completed;
  return record;
}

void VerifyInsertGetUpdateDelete(Repository& repo) {
  auto tx = repo.Begin();

  auto record = MakeTodo("lifecycle");
  assert(repo.InsertTodo(*tx, record));
  assert(record.id > 0);

  auto fetched = repo.GetTodo(*tx, record.id);
  assert(fetched.has_value());
  assert(fetched->title == "lifecycle");
  assert(fetched->completed == 0);

  fetched->completed = 1;
  fetched->title     = "lifecycle (done)";
  assert(repo.UpdateTodo(*tx, *fetched));

  auto updated = repo.GetTodo(*tx, record.id);
  assert(updated.has_value());
  assert(updated->completed == 1);
  assert(updated->title == "lifecycle (done)");

  assert(repo.DeleteTodo(*tx, record.id));
  assert(!repo.GetTodo(*tx, record.id).has_value());

  tx->Commit();
}

void VerifyMissingRowsReportNotFound(Repository& repo) {
  auto tx = repo.Begin();

  auto ghost = MakeTodo("ghost");
  ghost.id   = 987654321;
  auto upd   = repo.UpdateTodo(*tx, ghost);
  assert(!upd);
  assert(upd.code == ErrorCode::NotFound);

  auto del = repo.DeleteTodo(*tx, ghost.id);
  assert(!del);
  assert(del.code == ErrorCode::NotFound);

  assert(!repo.GetTodo(*tx, ghost.id).has_value());
  tx->Commit();
}

void VerifyListOrderAndMonotonicIds(Repository& repo) {
  std::vector<std::int64_t> ids;
  {
    auto tx = repo.Begin();
    for (const auto* title : {"one", "two", "three"}) {
      auto record = MakeTodo(title);
      assert(repo.InsertTodo(*tx, record));
      ids.push_back(record.id);
    }
    tx->Commit();
  }

  // delete the newest; its id must not come back
  {
    auto tx = repo.Begin();
    assert(repo.DeleteTodo(*tx, ids.back()));
    auto record = MakeTodo("four");
    assert(repo.InsertTodo(*tx, record));
    assert(record.id > ids.back());
    ids.back() = record.id;
    tx->Commit();
  }

  auto tx   = repo.Begin(TxMode::ReadOnly);
  auto rows = repo.ListTodos(*tx);
  tx->Commit();

  std::vector<std::int64_t> listed;
  for (const auto& row : rows) listed.push_back(row.id);
  for (size_t i = 1; i < listed.size(); ++i) {
    assert(listed[i - 1] < listed[i]);
  }
  assert(listed.size() >= ids.size());
  assert(std::vector<std::int64_t>(listed.end() - ids.size(), listed.end()) == ids);
}

void VerifyRollbackBehavior(Repository& repo) {
  std::int64_t id = 0;
  {
    auto tx     = repo.Begin();
    auto record = MakeTodo("rolled back");
    assert(repo.InsertTodo(*tx, record));
    id = record.id;
    tx->Rollback();
  }
  {
    auto tx = repo.Begin(TxMode::ReadOnly);
    assert(!repo.GetTodo(*tx, id).has_value());
    tx->Commit();
  }

  // destructor rolls back too
  {
    auto tx     = repo.Begin();
    auto record = MakeTodo("dropped");
    assert(repo.InsertTodo(*tx, record));
    id = record.id;
  }
  auto tx = repo.Begin(TxMode::ReadOnly);
  assert(!repo.GetTodo(*tx, id).has_value());
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto         repo = backend.make_repository();
  std::int64_t id   = 0;
  {
    auto tx     = repo->Begin();
    auto record = MakeTodo("durable", 1);
    assert(repo->InsertTodo(*tx, record));
    id = record.id;
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin(TxMode::ReadOnly);
  auto r  = repo->GetTodo(*tx, id);
  assert(r.has_value());
  assert(r->title == "durable");
  assert(r->completed == 1);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("todolist_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<todolist::db::sqlite::SqliteDB>(db_path);
    db->Exec("CREATE TABLE IF NOT EXISTS todos (id INTEGER PRIMARY KEY AUTOINCREMENT, title TEXT NOT NULL, completed INTEGER NOT NULL DEFAULT 0);");
    return std::make_shared<todolist::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup          = [db_path]() { std::filesystem::remove(db_path); },
  };
}

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyInsertGetUpdateDelete(*repo);
  VerifyMissingRowsReportNotFound(*repo);
  VerifyListOrderAndMonotonicIds(*repo);
  VerifyRollbackBehavior(*repo);

  repo.reset();
  VerifyRestartDurability(backend);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "todolist_integration_repository_parity: pass\n";
  return 0;
}
