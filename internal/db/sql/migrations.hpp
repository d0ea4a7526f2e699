#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace market::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements the executor. Migrations are applied in
  ascending version order; versions at or below SchemaVersion() are
  skipped, so running them again at every startup is harmless.
*/

struct Migration {
  int64_t                  version = 0;
  std::string              description;
  std::vector<std::string> statements;
};

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  // Highest applied version, 0 for an empty database.
  virtual int64_t SchemaVersion() = 0;

  // Runs all statements and records the version atomically.
  virtual void Apply(const Migration& migration) = 0;
};

// The indexer schema, written in the SQLite-compatible subset.
const std::vector<Migration>& SchemaMigrations();

// Returns the number of migrations applied.
std::size_t RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered);

} // namespace market::db::sql
