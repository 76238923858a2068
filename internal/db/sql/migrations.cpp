#include "migrations.hpp"

namespace assetdb::db::sql {

namespace {

const std::vector<std::string> kSqliteSchema = {
    "CREATE TABLE IF NOT EXISTS genesis_points (genesis_id INTEGER PRIMARY KEY, prev_out BLOB UNIQUE NOT NULL);",
    "CREATE TABLE IF NOT EXISTS genesis_assets (gen_asset_id INTEGER PRIMARY KEY, asset_id BLOB UNIQUE NOT NULL, asset_tag TEXT NOT NULL, meta_data BLOB, output_index INTEGER NOT NULL, asset_type SMALLINT NOT NULL, genesis_point_id INTEGER NOT NULL REFERENCES genesis_points(genesis_id));",
    "CREATE TABLE IF NOT EXISTS internal_keys (key_id INTEGER PRIMARY KEY, raw_key BLOB UNIQUE NOT NULL CHECK(length(raw_key) > 0), key_family INTEGER NOT NULL, key_index INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS asset_groups (group_id INTEGER PRIMARY KEY, tweaked_group_key BLOB UNIQUE NOT NULL, internal_key_id INTEGER NOT NULL REFERENCES internal_keys(key_id), genesis_point_id INTEGER NOT NULL REFERENCES genesis_points(genesis_id));",
    "CREATE TABLE IF NOT EXISTS asset_group_sigs (sig_id INTEGER PRIMARY KEY, genesis_sig BLOB NOT NULL, gen_asset_id INTEGER NOT NULL REFERENCES genesis_assets(gen_asset_id), group_key_id INTEGER NOT NULL REFERENCES asset_groups(group_id), UNIQUE(gen_asset_id, group_key_id));",
    "CREATE TABLE IF NOT EXISTS script_keys (script_key_id INTEGER PRIMARY KEY, internal_key_id INTEGER NOT NULL REFERENCES internal_keys(key_id), tweaked_script_key BLOB UNIQUE NOT NULL, tweak BLOB);",
    "CREATE TABLE IF NOT EXISTS assets (asset_id INTEGER PRIMARY KEY, genesis_id INTEGER NOT NULL REFERENCES genesis_assets(gen_asset_id), version INTEGER NOT NULL, script_key_id INTEGER NOT NULL REFERENCES script_keys(script_key_id), asset_group_sig_id INTEGER REFERENCES asset_group_sigs(sig_id), script_version INTEGER NOT NULL, amount BIGINT NOT NULL, lock_time INTEGER, relative_lock_time INTEGER, anchor_utxo_id BIGINT);",
    "CREATE UNIQUE INDEX IF NOT EXISTS assets_identity ON assets(genesis_id, script_key_id, COALESCE(anchor_utxo_id, -1));",
};

const std::vector<std::string> kPostgresSchema = {
    "CREATE TABLE IF NOT EXISTS genesis_points (genesis_id BIGSERIAL PRIMARY KEY, prev_out BYTEA UNIQUE NOT NULL);",
    "CREATE TABLE IF NOT EXISTS genesis_assets (gen_asset_id BIGSERIAL PRIMARY KEY, asset_id BYTEA UNIQUE NOT NULL, asset_tag BYTEA NOT NULL, meta_data BYTEA, output_index INTEGER NOT NULL, asset_type SMALLINT NOT NULL, genesis_point_id BIGINT NOT NULL REFERENCES genesis_points(genesis_id));",
    "CREATE TABLE IF NOT EXISTS internal_keys (key_id BIGSERIAL PRIMARY KEY, raw_key BYTEA UNIQUE NOT NULL CHECK(length(raw_key) > 0), key_family INTEGER NOT NULL, key_index INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS asset_groups (group_id BIGSERIAL PRIMARY KEY, tweaked_group_key BYTEA UNIQUE NOT NULL, internal_key_id BIGINT NOT NULL REFERENCES internal_keys(key_id), genesis_point_id BIGINT NOT NULL REFERENCES genesis_points(genesis_id));",
    "CREATE TABLE IF NOT EXISTS asset_group_sigs (sig_id BIGSERIAL PRIMARY KEY, genesis_sig BYTEA NOT NULL, gen_asset_id BIGINT NOT NULL REFERENCES genesis_assets(gen_asset_id), group_key_id BIGINT NOT NULL REFERENCES asset_groups(group_id), UNIQUE(gen_asset_id, group_key_id));",
    "CREATE TABLE IF NOT EXISTS script_keys (script_key_id BIGSERIAL PRIMARY KEY, internal_key_id BIGINT NOT NULL REFERENCES internal_keys(key_id), tweaked_script_key BYTEA UNIQUE NOT NULL, tweak BYTEA);",
    "CREATE TABLE IF NOT EXISTS assets (asset_id BIGSERIAL PRIMARY KEY, genesis_id BIGINT NOT NULL REFERENCES genesis_assets(gen_asset_id), version INTEGER NOT NULL, script_key_id BIGINT NOT NULL REFERENCES script_keys(script_key_id), asset_group_sig_id BIGINT REFERENCES asset_group_sigs(sig_id), script_version INTEGER NOT NULL, amount BIGINT NOT NULL, lock_time INTEGER, relative_lock_time INTEGER, anchor_utxo_id BIGINT);",
    "CREATE UNIQUE INDEX IF NOT EXISTS assets_identity ON assets(genesis_id, script_key_id, COALESCE(anchor_utxo_id, -1));",
};

} // namespace

const std::vector<std::string>& SchemaStatements(Dialect dialect) {
  return dialect == Dialect::kPostgres ? kPostgresSchema : kSqliteSchema;
}

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

} // namespace assetdb::db::sql
