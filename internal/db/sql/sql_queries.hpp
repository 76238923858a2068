#pragma once

#include <string>

namespace assetdb::db::sql {

/*
  Canonical SQL used by all backends.

  IMPORTANT:
  These are written in SQLite-compatible SQL subset with '?'
  placeholders. Postgres runs them through Numbered(), which rewrites
  the placeholders to $1 $2 $3 in order.

  Upserts are split in two statements: an INSERT .. ON CONFLICT that
  never fails on an existing identity, then a SELECT by identity that
  returns the primary key whether the row is new or not.
*/

// genesis points

static constexpr const char* INSERT_GENESIS_POINT =
    "INSERT INTO genesis_points(prev_out) VALUES(?)"
    " ON CONFLICT(prev_out) DO NOTHING;";

static constexpr const char* SELECT_GENESIS_POINT_ID =
    "SELECT genesis_id FROM genesis_points WHERE prev_out=?;";

// genesis assets

static constexpr const char* INSERT_GENESIS_ASSET =
    "INSERT INTO genesis_assets(asset_id,asset_tag,meta_data,output_index,asset_type,genesis_point_id)"
    " VALUES(?,?,?,?,?,?)"
    " ON CONFLICT(asset_id) DO NOTHING;";

static constexpr const char* SELECT_GENESIS_ASSET_ID =
    "SELECT gen_asset_id FROM genesis_assets WHERE asset_id=?;";

static constexpr const char* SELECT_GENESIS_BY_ID =
    "SELECT a.gen_asset_id,a.asset_id,a.asset_tag,a.meta_data,a.output_index,a.asset_type,p.prev_out"
    " FROM genesis_assets a JOIN genesis_points p ON a.genesis_point_id=p.genesis_id"
    " WHERE a.gen_asset_id=?;";

// internal keys

static constexpr const char* UPSERT_INTERNAL_KEY =
    "INSERT INTO internal_keys(raw_key,key_family,key_index) VALUES(?,?,?)"
    " ON CONFLICT(raw_key) DO UPDATE SET"
    " key_family=excluded.key_family,"
    " key_index=excluded.key_index"
    " WHERE internal_keys.key_family=0 AND internal_keys.key_index=0;";

static constexpr const char* SELECT_INTERNAL_KEY_BY_RAW =
    "SELECT key_id,key_family,key_index FROM internal_keys WHERE raw_key=?;";

static constexpr const char* SELECT_INTERNAL_KEY_BY_ID =
    "SELECT key_id,raw_key,key_family,key_index FROM internal_keys WHERE key_id=?;";

// script keys

static constexpr const char* UPSERT_SCRIPT_KEY =
    "INSERT INTO script_keys(internal_key_id,tweaked_script_key,tweak) VALUES(?,?,?)"
    " ON CONFLICT(tweaked_script_key) DO UPDATE SET"
    " internal_key_id=excluded.internal_key_id,"
    " tweak=excluded.tweak"
    " WHERE script_keys.tweak IS NULL AND excluded.tweak IS NOT NULL;";

static constexpr const char* SELECT_SCRIPT_KEY_ID_BY_TWEAKED =
    "SELECT script_key_id FROM script_keys WHERE tweaked_script_key=?;";

static constexpr const char* SELECT_SCRIPT_KEY_BY_ID =
    "SELECT script_key_id,internal_key_id,tweaked_script_key,tweak FROM script_keys WHERE script_key_id=?;";

// asset groups

static constexpr const char* INSERT_GROUP_KEY =
    "INSERT INTO asset_groups(tweaked_group_key,internal_key_id,genesis_point_id) VALUES(?,?,?)"
    " ON CONFLICT(tweaked_group_key) DO NOTHING;";

static constexpr const char* SELECT_GROUP_KEY_ID =
    "SELECT group_id FROM asset_groups WHERE tweaked_group_key=?;";

static constexpr const char* INSERT_GROUP_SIG =
    "INSERT INTO asset_group_sigs(genesis_sig,gen_asset_id,group_key_id) VALUES(?,?,?)"
    " ON CONFLICT(gen_asset_id,group_key_id) DO NOTHING;";

static constexpr const char* SELECT_GROUP_SIG_ID =
    "SELECT sig_id FROM asset_group_sigs WHERE gen_asset_id=? AND group_key_id=?;";

// assets

static constexpr const char* SELECT_ASSET_ID_BY_IDENTITY =
    "SELECT asset_id FROM assets"
    " WHERE genesis_id=? AND script_key_id=? AND COALESCE(anchor_utxo_id,-1)=COALESCE(?,CAST(-1 AS BIGINT));";

static constexpr const char* INSERT_ASSET =
    "INSERT INTO assets(genesis_id,version,script_key_id,asset_group_sig_id,script_version,amount,"
    "lock_time,relative_lock_time,anchor_utxo_id)"
    " VALUES(?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(genesis_id,script_key_id,COALESCE(anchor_utxo_id,-1)) DO NOTHING;";

static constexpr const char* SELECT_ASSET_BY_ID =
    "SELECT asset_id,genesis_id,version,script_key_id,asset_group_sig_id,script_version,amount,"
    "lock_time,relative_lock_time,anchor_utxo_id"
    " FROM assets WHERE asset_id=?;";

// Table names accepted by Repository::CountRows.
bool IsKnownTable(const std::string& table);

// Rewrites '?' placeholders to Postgres $N form.
std::string Numbered(const char* sql);

} // namespace assetdb::db::sql
