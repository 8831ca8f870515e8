#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace todolist::db::memory {

/*
  Transaction = snapshot + write set

  ReadWrite transactions serialize on the repository's writer
  mutex, the in-memory counterpart of BEGIN IMMEDIATE.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, TxMode mode);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable();
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&            repo_;
  TxMode                       mode_;
  std::unique_lock<std::mutex> writer_lock_;
  MemoryRepository::State      working_;
  bool                         committed_   = false;
  bool                         rolled_back_ = false;
};

} // namespace todolist::db::memory
