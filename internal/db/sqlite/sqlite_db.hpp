#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace market::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by all tasks; transactions on it are
  serialized through TxMutex().
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (pragmas, transaction control)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

  int64_t SchemaVersion() override;
  void    Apply(const sql::Migration& migration) override;

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

/*
  Prepared statement, finalized on scope exit.
  Prepare failures throw StorageFailure.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return stmt_;
  }

  // SQLITE_ROW, SQLITE_DONE or an error code.
  int Step();

 private:
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace market::db::sqlite
