#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace todolist::db::sqlite {

/*
  SQLite transaction wrapper.

  ReadWrite uses BEGIN IMMEDIATE:
    - grabs write lock early
    - a read-then-write cannot lose the row to another writer
  ReadOnly uses BEGIN DEFERRED.

  Holds the connection's TxMutex until destroyed.
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  std::unique_lock<std::mutex> lock_;
  bool committed_ = false;
  bool finished_ = false;
};

}
