#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace market::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, bool read_only)
    : db_(std::move(db)), lock_(db_->TxMutex()), read_only_(read_only) {
  db_->Exec(read_only ? "BEGIN DEFERRED;" : "BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) {
    return;
  }
  if (sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
    MARKET_LOG_WARN("sqlite rollback failed", {observability::StringField("error", sqlite3_errmsg(db_->Handle()))});
  }
}

sqlite3* SqliteTransaction::WriteHandle() const {
  if (read_only_) {
    throw util::InvalidState("write attempted in read-only transaction");
  }
  return db_->Handle();
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace market::db::sqlite
