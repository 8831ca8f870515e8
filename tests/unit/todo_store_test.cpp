#include <cassert>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/factory.hpp"
#include "internal/store/todo_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using todolist::db::ErrorCode;
using todolist::db::Repository;
using todolist::db::Result;
using todolist::db::Transaction;
using todolist::db::TxMode;
using todolist::db::memory::MemoryRepository;
using todolist::db::model::TodoRecord;
using todolist::model::CompletedValue;
using todolist::store::TodoItem;
using todolist::store::TodoPatch;
using todolist::store::TodoStore;

std::string TempDbPath(const std::string& name) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  return (std::filesystem::temp_directory_path() / ("todolist_store_" + name + "_" + std::to_string(stamp) + ".db")).string();
}

std::shared_ptr<TodoStore> MakeSqliteStore(const std::string& path) {
  todolist::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_sqlite()->set_path(path);
  return todolist::factory::BuildStore(config);
}

/*
  Delegates to a MemoryRepository, with switchable faults.
*/
class HookedRepository : public Repository {
 public:
  std::unique_ptr<Transaction> Begin(TxMode mode) override {
    return inner_.Begin(mode);
  }

  Result InsertTodo(Transaction& tx, TodoRecord& record) override {
    if (fail_writes) return Result::Err(ErrorCode::IOError, "disk I/O error");
    return inner_.InsertTodo(tx, record);
  }

  std::optional<TodoRecord> GetTodo(Transaction& tx, std::int64_t id) override {
    return inner_.GetTodo(tx, id);
  }

  std::vector<TodoRecord> ListTodos(Transaction& tx) override {
    return inner_.ListTodos(tx);
  }

  Result UpdateTodo(Transaction& tx, const TodoRecord& record) override {
    if (lose_updates) return Result::Err(ErrorCode::NotFound, "todo not found");
    return inner_.UpdateTodo(tx, record);
  }

  Result DeleteTodo(Transaction& tx, std::int64_t id) override {
    if (fail_writes) return Result::Err(ErrorCode::Busy, "database is locked");
    return inner_.DeleteTodo(tx, id);
  }

  bool fail_writes  = false;
  bool lose_updates = false;

 private:
  MemoryRepository inner_;
};

void TestAddDefaultsToNotCompleted(TodoStore& store) {
  auto item = store.Add("Buy milk");
  assert(item.id > 0);
  assert(item.title == "Buy milk");
  assert(!item.completed);
}

void TestListReturnsInsertionOrder(TodoStore& store) {
  auto a = store.Add("first");
  auto b = store.Add("second", CompletedValue{true});
  auto c = store.Add("third", CompletedValue{std::string("0")});

  auto items = store.List();
  assert(items.size() == 3);
  assert(items[0].id == a.id && items[1].id == b.id && items[2].id == c.id);
  assert(items[0].id < items[1].id && items[1].id < items[2].id);
  assert(items[0].title == "first" && !items[0].completed);
  assert(items[1].title == "second" && items[1].completed);
  assert(items[2].title == "third" && !items[2].completed);
}

void TestAddRoundTripsCoercedFlag(TodoStore& store) {
  auto added = store.Add("  padded title  ", CompletedValue{std::string(" TRUE ")});
  assert(added.completed);

  auto items = store.List();
  assert(items.size() == 1);
  assert(items[0].id == added.id);
  assert(items[0].title == "  padded title  ");
  assert(items[0].completed);
}

void TestAddUnparseableCompletedDefaultsToFalse(TodoStore& store) {
  auto item = store.Add("maybe", CompletedValue{std::string("perhaps")});
  assert(!item.completed);
  assert(!store.List().front().completed);
}

void TestUpdateCompletedKeepsTitle(TodoStore& store) {
  auto item = store.Add("Walk dog");

  TodoPatch patch;
  patch.completed = true;
  assert(store.Update(item.id, patch));

  auto items = store.List();
  assert(items.size() == 1);
  assert(items[0].title == "Walk dog");
  assert(items[0].completed);
}

void TestUpdateTitleKeepsCompleted(TodoStore& store) {
  auto item = store.Add("Old title", CompletedValue{std::int64_t{1}});

  TodoPatch patch;
  patch.title     = "New title";
  patch.completed = std::string("not a flag");
  assert(store.Update(item.id, patch));

  auto items = store.List();
  assert(items[0].title == "New title");
  assert(items[0].completed);
}

void TestUpdateMissingIdIsNoop(TodoStore& store) {
  auto item = store.Add("Untouched");

  TodoPatch patch;
  patch.title     = "Changed";
  patch.completed = true;
  assert(!store.Update(item.id + 1000, patch));
  assert(!store.Update(std::nullopt, patch));

  auto items = store.List();
  assert(items.size() == 1);
  assert(items[0].title == "Untouched");
  assert(!items[0].completed);
}

void TestUpdateRejectsBlankTitle(TodoStore& store) {
  auto item = store.Add("Keep me");

  TodoPatch patch;
  patch.title = "   ";
  bool threw  = false;
  try {
    store.Update(item.id, patch);
  } catch (const todolist::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
  assert(store.List()[0].title == "Keep me");
}

void TestEmbeddedNulTitleRoundTrips(TodoStore& store) {
  const std::string leading_nul("\0milk", 5);
  const std::string inner_nul("a\0b", 3);

  auto first  = store.Add(leading_nul);
  auto second = store.Add("draft");

  TodoPatch patch;
  patch.title = inner_nul;
  assert(store.Update(second.id, patch));

  auto items = store.List();
  assert(items.size() == 2);
  assert(items[0].id == first.id);
  assert(items[0].title == leading_nul);
  assert(items[0].title.size() == 5);
  assert(items[1].title == inner_nul);
  assert(items[1].title.size() == 3);
}

void TestDeleteIsReportedOnce(TodoStore& store) {
  auto keep = store.Add("keep");
  auto gone = store.Add("gone");

  assert(store.Delete(gone.id));
  assert(!store.Delete(gone.id));

  auto items = store.List();
  assert(items.size() == 1);
  assert(items[0].id == keep.id);
}

void TestIdsAreNotReused(TodoStore& store) {
  auto a = store.Add("a");
  auto b = store.Add("b");
  assert(store.Delete(b.id));

  auto c = store.Add("c");
  assert(c.id > b.id);
  assert(c.id != a.id);
}

void TestBlankTitleIsRejectedBeforeConnecting() {
  auto path  = TempDbPath("validation");
  auto store = MakeSqliteStore(path);

  for (const std::string title : {"", "   ", "\t\n"}) {
    bool threw = false;
    try {
      store->Add(title);
    } catch (const todolist::util::ValidationError& e) {
      threw = std::string(e.what()) == "title is required";
    }
    assert(threw);
  }

  assert(!store->IsInitialized());
  assert(!std::filesystem::exists(path));
}

void TestLegacyTextFlagsAreNormalized() {
  auto path = TempDbPath("legacy");
  auto store = MakeSqliteStore(path);
  store->Initialize();

  {
    todolist::db::sqlite::SqliteDB raw(path);
    raw.Exec("INSERT INTO todos(title,completed) VALUES('text true','true');");
    raw.Exec("INSERT INTO todos(title,completed) VALUES('text false','false');");
    raw.Exec("INSERT INTO todos(title,completed) VALUES('two',2);");
  }

  auto items = store->List();
  assert(items.size() == 3);
  assert(items[0].completed);
  assert(!items[1].completed);
  assert(!items[2].completed);

  std::filesystem::remove(path);
}

void TestSchemaSurvivesReopen() {
  auto path = TempDbPath("reopen");
  {
    auto store = MakeSqliteStore(path);
    store->Add("durable", CompletedValue{true});
  }

  auto reopened = MakeSqliteStore(path);
  auto items    = reopened->List();
  assert(items.size() == 1);
  assert(items[0].title == "durable");
  assert(items[0].completed);

  std::filesystem::remove(path);
}

void TestBackendWriteFailureIsConnectionError() {
  auto hooked = std::make_shared<HookedRepository>();
  TodoStore store([hooked]() -> std::shared_ptr<Repository> { return hooked; });

  auto item           = store.Add("before failure");
  hooked->fail_writes = true;

  bool threw = false;
  try {
    store.Add("during failure");
  } catch (const todolist::util::ConnectionError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    store.Delete(item.id);
  } catch (const todolist::util::ConnectionError&) {
    threw = true;
  }
  assert(threw);
  assert(store.List().size() == 1);
}

void TestVanishedRowIsInconsistentState() {
  auto hooked = std::make_shared<HookedRepository>();
  TodoStore store([hooked]() -> std::shared_ptr<Repository> { return hooked; });

  auto item            = store.Add("racy");
  hooked->lose_updates = true;

  TodoPatch patch;
  patch.completed = true;
  bool threw      = false;
  try {
    store.Update(item.id, patch);
  } catch (const todolist::util::InconsistentState&) {
    threw = true;
  }
  assert(threw);
  assert(!store.List()[0].completed);
}

template <typename Fn>
void WithFreshSqliteStore(const std::string& name, Fn&& fn) {
  auto path  = TempDbPath(name);
  auto store = MakeSqliteStore(path);
  fn(*store);
  std::filesystem::remove(path);
}

template <typename Fn>
void WithFreshMemoryStore(Fn&& fn) {
  TodoStore store([]() -> std::shared_ptr<Repository> { return std::make_shared<MemoryRepository>(); });
  fn(store);
}

template <typename Fn>
void OnBothBackends(const std::string& name, Fn&& fn) {
  WithFreshSqliteStore(name, fn);
  WithFreshMemoryStore(fn);
}

} // namespace

int main() {
  unsetenv("SQLITE_DB_LOCATION");

  OnBothBackends("add_default", TestAddDefaultsToNotCompleted);
  OnBothBackends("list_order", TestListReturnsInsertionOrder);
  OnBothBackends("round_trip", TestAddRoundTripsCoercedFlag);
  OnBothBackends("unparseable", TestAddUnparseableCompletedDefaultsToFalse);
  OnBothBackends("update_completed", TestUpdateCompletedKeepsTitle);
  OnBothBackends("update_title", TestUpdateTitleKeepsCompleted);
  OnBothBackends("update_missing", TestUpdateMissingIdIsNoop);
  OnBothBackends("update_blank", TestUpdateRejectsBlankTitle);
  OnBothBackends("nul_title", TestEmbeddedNulTitleRoundTrips);
  OnBothBackends("delete_once", TestDeleteIsReportedOnce);
  OnBothBackends("ids_not_reused", TestIdsAreNotReused);

  TestBlankTitleIsRejectedBeforeConnecting();
  TestLegacyTextFlagsAreNormalized();
  TestSchemaSurvivesReopen();
  TestBackendWriteFailureIsConnectionError();
  TestVanishedRowIsInconsistentState();

  std::cout << "todolist_unit_todo_store: pass\n";
  return 0;
}
