#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace assetdb::db::memory {

namespace {

template <typename Map, typename Pred>
typename Map::mapped_type* FindIf(Map& rows, Pred pred) {
  for (auto& [_, row] : rows) {
    if (pred(row)) return &row;
  }
  return nullptr;
}

bool LocatorIsZero(int32_t family, int32_t index) {
  return family == 0 && index == 0;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Genesis
// ------------------------------------------------------------------

Result MemoryRepository::UpsertGenesisPoint(Transaction& t, model::GenesisPointRecord& r) {
  auto& s = TX(t).Mutable();
  if (auto* existing = FindIf(s.genesis_points, [&](const auto& row) { return row.prev_out == r.prev_out; })) {
    r.genesis_id = existing->genesis_id;
    return Result::Ok();
  }
  r.genesis_id                    = s.next_id++;
  s.genesis_points[r.genesis_id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpsertGenesisAsset(Transaction& t, model::GenesisAssetRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.genesis_points.contains(r.genesis_point_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "genesis_assets.genesis_point_id references a missing genesis point");
  }
  if (auto* existing = FindIf(s.genesis_assets, [&](const auto& row) { return row.asset_id == r.asset_id; })) {
    r.gen_asset_id = existing->gen_asset_id;
    return Result::Ok();
  }
  r.gen_asset_id                   = s.next_id++;
  s.genesis_assets[r.gen_asset_id] = r;
  return Result::Ok();
}

Result MemoryRepository::FetchGenesisByID(Transaction& t, int64_t gen_asset_id, model::GenesisRecord& out) {
  const auto& s  = TX(t).View();
  const auto  it = s.genesis_assets.find(gen_asset_id);
  if (it == s.genesis_assets.end()) return Result::Err(ErrorCode::NotFound, "no genesis asset with id " + std::to_string(gen_asset_id));

  const auto point = s.genesis_points.find(it->second.genesis_point_id);
  if (point == s.genesis_points.end()) return Result::Err(ErrorCode::Corruption, "genesis asset without genesis point");

  out.gen_asset_id = it->second.gen_asset_id;
  out.asset_id     = it->second.asset_id;
  out.asset_tag    = it->second.asset_tag;
  out.meta_data    = it->second.meta_data;
  out.output_index = it->second.output_index;
  out.asset_type   = it->second.asset_type;
  out.prev_out     = point->second.prev_out;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Keys
// ------------------------------------------------------------------

Result MemoryRepository::UpsertInternalKey(Transaction& t, model::InternalKeyRecord& r) {
  auto& s = TX(t).Mutable();
  if (r.raw_key.empty()) {
    return Result::Err(ErrorCode::ConstraintViolation, "internal_keys.raw_key must not be empty");
  }

  auto* existing = FindIf(s.internal_keys, [&](const auto& row) { return row.raw_key == r.raw_key; });
  if (!existing) {
    r.key_id                  = s.next_id++;
    s.internal_keys[r.key_id] = r;
    return Result::Ok();
  }

  if (LocatorIsZero(existing->key_family, existing->key_index)) {
    existing->key_family = r.key_family;
    existing->key_index  = r.key_index;
  } else if (!LocatorIsZero(r.key_family, r.key_index) &&
             (existing->key_family != r.key_family || existing->key_index != r.key_index)) {
    return Result::Err(ErrorCode::Conflict, "internal key already stored with a different key locator");
  }

  r = *existing;
  return Result::Ok();
}

Result MemoryRepository::FetchInternalKey(Transaction& t, int64_t key_id, model::InternalKeyRecord& out) {
  const auto& s  = TX(t).View();
  const auto  it = s.internal_keys.find(key_id);
  if (it == s.internal_keys.end()) return Result::Err(ErrorCode::NotFound);
  out = it->second;
  return Result::Ok();
}

Result MemoryRepository::FetchScriptKeyIDByTweakedKey(Transaction& t, const util::Bytes& tweaked_key, int64_t& script_key_id) {
  auto& s = TX(t).Mutable();
  if (auto* existing = FindIf(s.script_keys, [&](const auto& row) { return row.tweaked_script_key == tweaked_key; })) {
    script_key_id = existing->script_key_id;
    return Result::Ok();
  }
  return Result::Err(ErrorCode::NotFound);
}

Result MemoryRepository::UpsertScriptKey(Transaction& t, model::ScriptKeyRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.internal_keys.contains(r.internal_key_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "script_keys.internal_key_id references a missing internal key");
  }

  auto* existing = FindIf(s.script_keys, [&](const auto& row) { return row.tweaked_script_key == r.tweaked_script_key; });
  if (!existing) {
    r.script_key_id                = s.next_id++;
    s.script_keys[r.script_key_id] = r;
    return Result::Ok();
  }

  if (!existing->tweak.has_value() && r.tweak.has_value()) {
    existing->internal_key_id = r.internal_key_id;
    existing->tweak           = r.tweak;
  }
  r.script_key_id = existing->script_key_id;
  return Result::Ok();
}

Result MemoryRepository::FetchScriptKey(Transaction& t, int64_t script_key_id, model::ScriptKeyRecord& out) {
  const auto& s  = TX(t).View();
  const auto  it = s.script_keys.find(script_key_id);
  if (it == s.script_keys.end()) return Result::Err(ErrorCode::NotFound);
  out = it->second;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Asset groups
// ------------------------------------------------------------------

Result MemoryRepository::UpsertAssetGroupKey(Transaction& t, model::GroupKeyRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.internal_keys.contains(r.internal_key_id) || !s.genesis_points.contains(r.genesis_point_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "asset_groups references a missing row");
  }
  if (auto* existing = FindIf(s.group_keys, [&](const auto& row) { return row.tweaked_group_key == r.tweaked_group_key; })) {
    r.group_id = existing->group_id;
    return Result::Ok();
  }
  r.group_id               = s.next_id++;
  s.group_keys[r.group_id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpsertAssetGroupSig(Transaction& t, model::GroupSigRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.genesis_assets.contains(r.gen_asset_id) || !s.group_keys.contains(r.group_key_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "asset_group_sigs references a missing row");
  }
  if (auto* existing = FindIf(s.group_sigs, [&](const auto& row) {
        return row.gen_asset_id == r.gen_asset_id && row.group_key_id == r.group_key_id;
      })) {
    r.sig_id = existing->sig_id;
    return Result::Ok();
  }
  r.sig_id               = s.next_id++;
  s.group_sigs[r.sig_id] = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Assets
// ------------------------------------------------------------------

Result MemoryRepository::InsertNewAsset(Transaction& t, model::AssetRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.genesis_assets.contains(r.genesis_id) || !s.script_keys.contains(r.script_key_id) ||
      (r.asset_group_sig_id.has_value() && !s.group_sigs.contains(*r.asset_group_sig_id))) {
    return Result::Err(ErrorCode::ConstraintViolation, "assets references a missing row");
  }
  if (auto* existing = FindIf(s.assets, [&](const auto& row) {
        return row.genesis_id == r.genesis_id && row.script_key_id == r.script_key_id && row.anchor_utxo_id == r.anchor_utxo_id;
      })) {
    r.asset_id = existing->asset_id;
    return Result::Ok();
  }
  r.asset_id           = s.next_id++;
  s.assets[r.asset_id] = r;
  return Result::Ok();
}

Result MemoryRepository::FetchAsset(Transaction& t, int64_t asset_id, model::AssetRecord& out) {
  const auto& s  = TX(t).View();
  const auto  it = s.assets.find(asset_id);
  if (it == s.assets.end()) return Result::Err(ErrorCode::NotFound);
  out = it->second;
  return Result::Ok();
}

Result MemoryRepository::CountRows(Transaction& t, std::string_view table, int64_t& count) {
  const auto&       s = TX(t).View();
  const std::string name(table);
  if (name == "genesis_points") {
    count = static_cast<int64_t>(s.genesis_points.size());
  } else if (name == "genesis_assets") {
    count = static_cast<int64_t>(s.genesis_assets.size());
  } else if (name == "internal_keys") {
    count = static_cast<int64_t>(s.internal_keys.size());
  } else if (name == "script_keys") {
    count = static_cast<int64_t>(s.script_keys.size());
  } else if (name == "asset_groups") {
    count = static_cast<int64_t>(s.group_keys.size());
  } else if (name == "asset_group_sigs") {
    count = static_cast<int64_t>(s.group_sigs.size());
  } else if (name == "assets") {
    count = static_cast<int64_t>(s.assets.size());
  } else {
    return Result::Err(ErrorCode::Unsupported, "unknown table " + name);
  }
  return Result::Ok();
}

} // namespace assetdb::db::memory
