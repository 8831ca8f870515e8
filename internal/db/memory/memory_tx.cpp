#include "memory_tx.hpp"

#include <stdexcept>

namespace todolist::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, TxMode mode) : repo_(repo), mode_(mode) {
  if (mode_ == TxMode::ReadWrite) {
    writer_lock_ = std::unique_lock<std::mutex>(repo_.writer_mutex_);
  }
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (mode_ != TxMode::ReadWrite) {
    throw std::logic_error("write attempted in a read-only transaction");
  }
  return working_;
}

void MemoryTransaction::Commit() {
  if (mode_ == TxMode::ReadWrite) {
    std::scoped_lock lock(repo_.mutex_);
    repo_.committed_ = std::move(working_);
  }
  committed_ = true;
  if (writer_lock_.owns_lock()) writer_lock_.unlock();
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
  if (writer_lock_.owns_lock()) writer_lock_.unlock();
}

} // namespace todolist::db::memory
