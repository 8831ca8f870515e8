#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace todolist::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode)
    : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec(mode == TxMode::ReadWrite ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      TODOLIST_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_ = true;
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  finished_ = true;
}

} // namespace todolist::db::sqlite
