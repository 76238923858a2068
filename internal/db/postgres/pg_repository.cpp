#include "pg_repository.hpp"

#include <cstddef>
#include <string>

#include "internal/db/sql/sql_queries.hpp"

namespace assetdb::db::postgres {

namespace {

using Bytea = std::basic_string<std::byte>;

Bytea ToBytea(const util::Bytes& b) {
  return Bytea(reinterpret_cast<const std::byte*>(b.data()), b.size());
}

std::optional<Bytea> ToBytea(const std::optional<util::Bytes>& b) {
  if (!b.has_value()) return std::nullopt;
  return ToBytea(*b);
}

util::Bytes FromBytea(const pqxx::field& f) {
  if (f.is_null()) return {};
  const auto raw = f.as<Bytea>();
  const auto* p  = reinterpret_cast<const uint8_t*>(raw.data());
  return util::Bytes(p, p + raw.size());
}

// Tags are arbitrary bytes; TEXT would reject an embedded NUL.
Bytea TagToBytea(const std::string& tag) {
  return Bytea(reinterpret_cast<const std::byte*>(tag.data()), tag.size());
}

std::string TagFromBytea(const pqxx::field& f) {
  const auto raw = FromBytea(f);
  return std::string(raw.begin(), raw.end());
}

template <typename T>
std::optional<T> OptionalField(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<T>();
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Genesis
// ------------------------------------------------------------------

Result PgRepository::UpsertGenesisPoint(Transaction& t, model::GenesisPointRecord& r) {
  try {
    auto& w = TX(t).Work();
    w.exec_prepared("insert_genesis_point", ToBytea(r.prev_out));
    auto res = w.exec_prepared("select_genesis_point_id", ToBytea(r.prev_out));
    if (res.empty()) return Result::Err(ErrorCode::InternalError, "genesis point vanished after upsert");
    r.genesis_id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpsertGenesisAsset(Transaction& t, model::GenesisAssetRecord& r) {
  try {
    auto& w = TX(t).Work();
    w.exec_prepared("insert_genesis_asset", ToBytea(r.asset_id), TagToBytea(r.asset_tag), ToBytea(r.meta_data), r.output_index,
                    static_cast<int32_t>(r.asset_type), r.genesis_point_id);
    auto res = w.exec_prepared("select_genesis_asset_id", ToBytea(r.asset_id));
    if (res.empty()) return Result::Err(ErrorCode::InternalError, "genesis asset vanished after upsert");
    r.gen_asset_id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::FetchGenesisByID(Transaction& t, int64_t gen_asset_id, model::GenesisRecord& out) {
  try {
    auto res = TX(t).Work().exec_prepared("select_genesis_by_id", gen_asset_id);
    if (res.empty()) return Result::Err(ErrorCode::NotFound, "no genesis asset with id " + std::to_string(gen_asset_id));

    const auto row   = res[0];
    out.gen_asset_id = row[0].as<int64_t>();
    out.asset_id     = FromBytea(row[1]);
    out.asset_tag    = TagFromBytea(row[2]);
    out.meta_data    = FromBytea(row[3]);
    out.output_index = row[4].as<int32_t>();
    out.asset_type   = static_cast<int16_t>(row[5].as<int32_t>());
    out.prev_out     = FromBytea(row[6]);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Keys
// ------------------------------------------------------------------

Result PgRepository::UpsertInternalKey(Transaction& t, model::InternalKeyRecord& r) {
  try {
    auto& w = TX(t).Work();
    w.exec_prepared("upsert_internal_key", ToBytea(r.raw_key), r.key_family, r.key_index);
    auto res = w.exec_prepared("select_internal_key_by_raw", ToBytea(r.raw_key));
    if (res.empty()) return Result::Err(ErrorCode::InternalError, "internal key vanished after upsert");

    const auto stored_family = res[0][1].as<int32_t>();
    const auto stored_index  = res[0][2].as<int32_t>();
    const bool incoming_zero = r.key_family == 0 && r.key_index == 0;
    if (!incoming_zero && (stored_family != r.key_family || stored_index != r.key_index)) {
      return Result::Err(ErrorCode::Conflict, "internal key already stored with a different key locator");
    }

    r.key_id     = res[0][0].as<int64_t>();
    r.key_family = stored_family;
    r.key_index  = stored_index;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::FetchInternalKey(Transaction& t, int64_t key_id, model::InternalKeyRecord& out) {
  try {
    auto res = TX(t).Work().exec_prepared("select_internal_key_by_id", key_id);
    if (res.empty()) return Result::Err(ErrorCode::NotFound);

    out.key_id     = res[0][0].as<int64_t>();
    out.raw_key    = FromBytea(res[0][1]);
    out.key_family = res[0][2].as<int32_t>();
    out.key_index  = res[0][3].as<int32_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::FetchScriptKeyIDByTweakedKey(Transaction& t, const util::Bytes& tweaked_key, int64_t& script_key_id) {
  try {
    auto res = TX(t).Work().exec_prepared("select_script_key_id_by_tweaked", ToBytea(tweaked_key));
    if (res.empty()) return Result::Err(ErrorCode::NotFound);
    script_key_id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpsertScriptKey(Transaction& t, model::ScriptKeyRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_script_key", r.internal_key_id, ToBytea(r.tweaked_script_key), ToBytea(r.tweak));
  } catch (const std::exception& e) {
    return Translate(e);
  }
  return FetchScriptKeyIDByTweakedKey(t, r.tweaked_script_key, r.script_key_id);
}

Result PgRepository::FetchScriptKey(Transaction& t, int64_t script_key_id, model::ScriptKeyRecord& out) {
  try {
    auto res = TX(t).Work().exec_prepared("select_script_key_by_id", script_key_id);
    if (res.empty()) return Result::Err(ErrorCode::NotFound);

    out.script_key_id      = res[0][0].as<int64_t>();
    out.internal_key_id    = res[0][1].as<int64_t>();
    out.tweaked_script_key = FromBytea(res[0][2]);
    if (res[0][3].is_null()) {
      out.tweak.reset();
    } else {
      out.tweak = FromBytea(res[0][3]);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Asset groups
// ------------------------------------------------------------------

Result PgRepository::UpsertAssetGroupKey(Transaction& t, model::GroupKeyRecord& r) {
  try {
    auto& w = TX(t).Work();
    w.exec_prepared("insert_group_key", ToBytea(r.tweaked_group_key), r.internal_key_id, r.genesis_point_id);
    auto res = w.exec_prepared("select_group_key_id", ToBytea(r.tweaked_group_key));
    if (res.empty()) return Result::Err(ErrorCode::InternalError, "group key vanished after upsert");
    r.group_id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpsertAssetGroupSig(Transaction& t, model::GroupSigRecord& r) {
  try {
    auto& w = TX(t).Work();
    w.exec_prepared("insert_group_sig", ToBytea(r.genesis_sig), r.gen_asset_id, r.group_key_id);
    auto res = w.exec_prepared("select_group_sig_id", r.gen_asset_id, r.group_key_id);
    if (res.empty()) return Result::Err(ErrorCode::InternalError, "group sig vanished after upsert");
    r.sig_id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Assets
// ------------------------------------------------------------------

Result PgRepository::InsertNewAsset(Transaction& t, model::AssetRecord& r) {
  try {
    auto& w = TX(t).Work();
    w.exec_prepared("insert_asset", r.genesis_id, r.version, r.script_key_id, r.asset_group_sig_id, r.script_version, r.amount,
                    r.lock_time, r.relative_lock_time, r.anchor_utxo_id);
    auto res = w.exec_prepared("select_asset_id_by_identity", r.genesis_id, r.script_key_id, r.anchor_utxo_id);
    if (res.empty()) return Result::Err(ErrorCode::InternalError, "asset vanished after upsert");
    r.asset_id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::FetchAsset(Transaction& t, int64_t asset_id, model::AssetRecord& out) {
  try {
    auto res = TX(t).Work().exec_prepared("select_asset_by_id", asset_id);
    if (res.empty()) return Result::Err(ErrorCode::NotFound);

    const auto row         = res[0];
    out.asset_id           = row[0].as<int64_t>();
    out.genesis_id         = row[1].as<int64_t>();
    out.version            = row[2].as<int32_t>();
    out.script_key_id      = row[3].as<int64_t>();
    out.asset_group_sig_id = OptionalField<int64_t>(row[4]);
    out.script_version     = row[5].as<int32_t>();
    out.amount             = row[6].as<int64_t>();
    out.lock_time          = OptionalField<int32_t>(row[7]);
    out.relative_lock_time = OptionalField<int32_t>(row[8]);
    out.anchor_utxo_id     = OptionalField<int64_t>(row[9]);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::CountRows(Transaction& t, std::string_view table, int64_t& count) {
  const std::string name(table);
  if (!sql::IsKnownTable(name)) return Result::Err(ErrorCode::Unsupported, "unknown table " + name);
  try {
    auto res = TX(t).Work().exec("SELECT COUNT(*) FROM " + name + ";");
    count    = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace assetdb::db::postgres
