#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/observability/logging.hpp"
#if ASSETDB_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if ASSETDB_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace assetdb::factory {

namespace {

#if ASSETDB_DB_SQLITE
class SqliteMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(db::sqlite::SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  db::sqlite::SqliteDB& db_;
};
#endif

#if ASSETDB_DB_POSTGRES
class PgMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const assetdb::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if ASSETDB_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());

    SqliteMigrationExecutor executor(*sqlite_db);
    db::sql::RunMigrations(executor, db::sql::SchemaStatements(db::sql::Dialect::kSqlite));

    ASSETDB_LOG_INFO("opened sqlite asset store", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if ASSETDB_DB_POSTGRES
    const auto& postgres = database.postgres();

    // pooled connections prepare statements on connect, so the tables
    // must exist before the first Acquire()
    {
      pqxx::connection conn(postgres.connection_uri());
      pqxx::work       tx(conn);

      PgMigrationExecutor executor(tx);
      db::sql::RunMigrations(executor, db::sql::SchemaStatements(db::sql::Dialect::kPostgres));
      tx.commit();
    }

    auto pool = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), postgres.max_connections());

    ASSETDB_LOG_INFO("opened postgres asset store",
                     {observability::IntField("max_connections", postgres.max_connections())});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  ASSETDB_LOG_INFO("using in-memory asset store");
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace assetdb::factory
