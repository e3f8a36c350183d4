#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace datarouter::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    DATAROUTER_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (finished_) throw std::logic_error("transaction already finished");
  db_->Exec("COMMIT;");
  finished_ = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  db_->Exec("ROLLBACK;");
  lock_.unlock();
}

} // namespace datarouter::db::sqlite
