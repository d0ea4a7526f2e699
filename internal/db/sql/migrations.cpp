#include "migrations.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace market::db::sql {

const std::vector<Migration>& SchemaMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       "initial schema",
       {
           "CREATE TABLE IF NOT EXISTS settings (key TEXT PRIMARY KEY, value TEXT NOT NULL);",

           "CREATE TABLE IF NOT EXISTS admins (idx INTEGER PRIMARY KEY, address TEXT NOT NULL, last_sync INTEGER NOT NULL,"
           " category TEXT NOT NULL DEFAULT '', nickname TEXT NOT NULL DEFAULT '', about TEXT NOT NULL DEFAULT '',"
           " can_approve_user INTEGER NOT NULL DEFAULT 0, can_revoke_user INTEGER NOT NULL DEFAULT 0,"
           " revoked INTEGER NOT NULL DEFAULT 0);",

           "CREATE TABLE IF NOT EXISTS users (idx INTEGER PRIMARY KEY, address TEXT NOT NULL, last_sync INTEGER NOT NULL,"
           " status INTEGER NOT NULL, nickname TEXT NOT NULL DEFAULT '', language TEXT NOT NULL DEFAULT '',"
           " specialization TEXT NOT NULL DEFAULT '', telegram TEXT NOT NULL DEFAULT '', portfolio TEXT NOT NULL DEFAULT '',"
           " resume TEXT NOT NULL DEFAULT '', about TEXT NOT NULL DEFAULT '', about_hash BLOB, created_at INTEGER NOT NULL);",

           "CREATE TABLE IF NOT EXISTS orders (idx INTEGER PRIMARY KEY, address TEXT NOT NULL, last_sync INTEGER NOT NULL,"
           " status INTEGER NOT NULL, category TEXT NOT NULL DEFAULT '', language TEXT NOT NULL DEFAULT '',"
           " customer_address TEXT NOT NULL DEFAULT '', freelancer_address TEXT NOT NULL DEFAULT '',"
           " name TEXT NOT NULL DEFAULT '', name_hash BLOB, description TEXT NOT NULL DEFAULT '', description_hash BLOB,"
           " technical_task TEXT NOT NULL DEFAULT '', technical_task_hash BLOB, price INTEGER NOT NULL DEFAULT 0,"
           " deadline INTEGER NOT NULL, created_at INTEGER NOT NULL, responses_count INTEGER NOT NULL DEFAULT 0,"
           " arbitration_freelancer_part INTEGER NOT NULL DEFAULT 0);",

           "CREATE TABLE IF NOT EXISTS categories (hash TEXT PRIMARY KEY, name TEXT NOT NULL, is_active INTEGER NOT NULL);",

           "CREATE TABLE IF NOT EXISTS languages (hash TEXT PRIMARY KEY, name TEXT NOT NULL, is_active INTEGER NOT NULL);",

           "CREATE TABLE IF NOT EXISTS translations (hash BLOB NOT NULL, language TEXT NOT NULL, translated_text TEXT,"
           " timestamp INTEGER NOT NULL, PRIMARY KEY (hash, language));",

           "CREATE TABLE IF NOT EXISTS order_responses (order_index INTEGER NOT NULL, freelancer_address TEXT NOT NULL,"
           " text TEXT NOT NULL DEFAULT '', price INTEGER NOT NULL DEFAULT 0, timestamp INTEGER NOT NULL,"
           " PRIMARY KEY (order_index, freelancer_address));",

           "CREATE TABLE IF NOT EXISTS order_activities (id INTEGER PRIMARY KEY AUTOINCREMENT, order_index INTEGER NOT NULL,"
           " sender_address TEXT NOT NULL, op_code INTEGER NOT NULL, amount INTEGER NOT NULL DEFAULT 0,"
           " tx_hash TEXT NOT NULL DEFAULT '', timestamp INTEGER NOT NULL);",
           "CREATE INDEX IF NOT EXISTS order_activities_by_order ON order_activities (order_index, timestamp);",
           "CREATE INDEX IF NOT EXISTS order_activities_by_sender ON order_activities (sender_address, timestamp);",

           "CREATE TABLE IF NOT EXISTS sync_queue (id INTEGER PRIMARY KEY AUTOINCREMENT, entity_type INTEGER NOT NULL,"
           " idx INTEGER NOT NULL, sync_at INTEGER NOT NULL, min_last_sync INTEGER NOT NULL,"
           " retry_count INTEGER NOT NULL DEFAULT 0);",
           "CREATE INDEX IF NOT EXISTS sync_queue_by_sync_at ON sync_queue (sync_at, id);",
           "CREATE INDEX IF NOT EXISTS sync_queue_by_entity ON sync_queue (entity_type, idx);",
       }},
  };
  return kMigrations;
}

std::size_t RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered) {
  const auto current = executor.SchemaVersion();

  std::size_t applied = 0;
  int64_t     last    = 0;
  for (const auto& migration : ordered) {
    if (migration.version <= last) {
      throw util::InvalidState("migrations out of order at version " + std::to_string(migration.version));
    }
    last = migration.version;

    if (migration.version <= current) {
      continue;
    }
    executor.Apply(migration);
    ++applied;
    MARKET_LOG_INFO("Applied schema migration", {observability::IntField("version", migration.version),
                                                 observability::StringField("description", migration.description)});
  }
  return applied;
}

} // namespace market::db::sql
