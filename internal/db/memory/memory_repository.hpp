#pragma once

#include <cstdint>
#include <map>
#include <mutex>

#include "internal/db/api/repository.hpp"

namespace todolist::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin(TxMode mode = TxMode::ReadWrite) override;

  Result InsertTodo(Transaction&, model::TodoRecord&) override;
  std::optional<model::TodoRecord> GetTodo(Transaction&, std::int64_t id) override;
  std::vector<model::TodoRecord> ListTodos(Transaction&) override;
  Result UpdateTodo(Transaction&, const model::TodoRecord&) override;
  Result DeleteTodo(Transaction&, std::int64_t id) override;

private:
  friend class MemoryTransaction;

  struct State {
    // ordered by id, so listing is already ascending
    std::map<std::int64_t, model::TodoRecord> todos;
    std::int64_t next_id = 1;
  };

  // guards committed_
  std::mutex mutex_;
  // held by every ReadWrite transaction
  std::mutex writer_mutex_;
  State committed_;
};

}
