#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace todolist::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin(TxMode mode) {
  return std::make_unique<MemoryTransaction>(*this, mode);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertTodo(Transaction& t, model::TodoRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_id++;
  s.todos[r.id] = r;
  return Result::Ok();
}

std::optional<model::TodoRecord> MemoryRepository::GetTodo(Transaction& t, std::int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.todos.find(id);
  if (it == s.todos.end()) return std::nullopt;
  return it->second;
}

std::vector<model::TodoRecord> MemoryRepository::ListTodos(Transaction& t) {
  const auto&                    s = TX(t).View();
  std::vector<model::TodoRecord> records;
  records.reserve(s.todos.size());
  for (const auto& [_, record] : s.todos) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::UpdateTodo(Transaction& t, const model::TodoRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.todos.find(r.id);
  if (it == s.todos.end()) return Result::Err(ErrorCode::NotFound, "todo not found");
  it->second = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteTodo(Transaction& t, std::int64_t id) {
  auto& s = TX(t).Mutable();
  if (s.todos.erase(id) == 0) return Result::Err(ErrorCode::NotFound, "todo not found");
  return Result::Ok();
}

} // namespace todolist::db::memory
