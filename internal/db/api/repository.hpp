#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/todo_record.hpp"

namespace todolist::db {

/*
  Repository abstraction over the single `todos` table.

  GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - Ids are assigned by the backend, increase monotonically and
    are never reused, even after the row is deleted
  - ListTodos returns rows in ascending id order
  - Backend failures on reads throw util::ConnectionError; writes
    report them through Result
*/

class Repository {
 public:
  virtual ~Repository() = default;

  virtual std::unique_ptr<Transaction> Begin(TxMode mode = TxMode::ReadWrite) = 0;

  // Assigns record.id on success.
  virtual Result InsertTodo(Transaction&, model::TodoRecord& record) = 0;

  virtual std::optional<model::TodoRecord> GetTodo(Transaction&, std::int64_t id) = 0;

  virtual std::vector<model::TodoRecord> ListTodos(Transaction&) = 0;

  // NotFound when no row with record.id exists.
  virtual Result UpdateTodo(Transaction&, const model::TodoRecord& record) = 0;

  // NotFound when no row with id exists.
  virtual Result DeleteTodo(Transaction&, std::int64_t id) = 0;
};

} // namespace todolist::db
