#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace market::db::sqlite {

/*
  SQLite transaction wrapper.

  Write transactions use BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids SQLITE_BUSY on lock upgrade later
  Read transactions use BEGIN DEFERRED; under WAL the first read pins
  a snapshot that stays stable until the transaction ends.
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, bool read_only);
  ~SqliteTransaction() override;

  sqlite3* Handle() const { return db_->Handle(); }

  // Throws InvalidState inside a read transaction.
  sqlite3* WriteHandle() const;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }
  bool IsReadOnly() const override { return read_only_; }

private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  bool                         read_only_ = false;
  bool                         committed_ = false;
  bool                         finished_  = false;
};

}
