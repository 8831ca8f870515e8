#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace todolist::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin(TxMode mode = TxMode::ReadWrite) override;

  Result InsertTodo(Transaction&, model::TodoRecord&) override;
  std::optional<model::TodoRecord> GetTodo(Transaction&, std::int64_t id) override;
  std::vector<model::TodoRecord> ListTodos(Transaction&) override;
  Result UpdateTodo(Transaction&, const model::TodoRecord&) override;
  Result DeleteTodo(Transaction&, std::int64_t id) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
