#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace market::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    const std::string msg = std::string(what) + ": " + sqlite3_errmsg(db);
    if ((rc & 0xff) == SQLITE_IOERR || (rc & 0xff) == SQLITE_CORRUPT) {
      throw util::StorageFatal(msg);
    }
    throw util::StorageFailure(msg);
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StorageFatal("open " + path_ + ": " + msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    if ((rc & 0xff) == SQLITE_IOERR || (rc & 0xff) == SQLITE_CORRUPT) {
      throw util::StorageFatal(msg);
    }
    throw util::StorageFailure(msg);
  }
}

void SqliteDB::Configure() {
  // WAL lets the rebuild scan read while the sync task writes
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=-20000;"); // ~20MB (negative means KB)
}

int64_t SqliteDB::SchemaVersion() {
  std::scoped_lock lock(tx_mutex_);
  Exec("CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at INTEGER NOT NULL);");

  Statement st(db_, "SELECT COALESCE(MAX(version), 0) FROM schema_migrations;");
  if (st.Step() != SQLITE_ROW) {
    ThrowIf(sqlite3_errcode(db_), db_, "schema version");
    return 0;
  }
  return sqlite3_column_int64(st.get(), 0);
}

void SqliteDB::Apply(const sql::Migration& migration) {
  std::scoped_lock lock(tx_mutex_);
  Exec("BEGIN IMMEDIATE;");
  try {
    for (const auto& statement : migration.statements) {
      Exec(statement);
    }

    Statement st(db_, "INSERT INTO schema_migrations(version, applied_at) VALUES(?, strftime('%s','now'));");
    sqlite3_bind_int64(st.get(), 1, migration.version);
    if (st.Step() != SQLITE_DONE) {
      ThrowIf(sqlite3_errcode(db_), db_, "record migration");
    }
    Exec("COMMIT;");
  } catch (const std::exception&) {
    sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    throw;
  }
}

Statement::Statement(sqlite3* db, const char* sql) {
  ThrowIf(sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr), db, "sqlite prepare");
}

Statement::~Statement() {
  sqlite3_finalize(stmt_);
}

int Statement::Step() {
  return sqlite3_step(stmt_);
}

} // namespace market::db::sqlite
