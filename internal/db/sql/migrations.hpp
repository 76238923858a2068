#pragma once

#include <string>
#include <vector>

namespace assetdb::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

enum class Dialect {
  kSqlite,
  kPostgres,
};

/*
  Schema for the asset tables, in foreign key order:

    genesis_points -> genesis_assets -> internal_keys
      -> asset_groups -> asset_group_sigs -> script_keys -> assets

  Every statement is idempotent (IF NOT EXISTS).
*/
const std::vector<std::string>& SchemaStatements(Dialect dialect);

/*
  Runs migrations in order.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace assetdb::db::sql
