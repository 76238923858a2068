#include "asset_importer.hpp"

#include <limits>
#include <string>

#include "internal/core/store_errors.hpp"
#include "internal/util/errors.hpp"

namespace assetdb::core {

namespace {

// Lock times are stored as nullable INTEGER; zero means no lock.
std::optional<int32_t> ToLockTime(uint64_t value, const char* field) {
  if (value == 0) {
    return std::nullopt;
  }
  if (value > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
    throw util::InvalidArgument(std::string("insert asset: ") + field + " out of range: " + std::to_string(value));
  }
  return static_cast<int32_t>(value);
}

int32_t ToInt32(uint32_t value, const char* field) {
  if (value > static_cast<uint32_t>(std::numeric_limits<int32_t>::max())) {
    throw util::InvalidArgument(std::string("insert asset: ") + field + " out of range: " + std::to_string(value));
  }
  return static_cast<int32_t>(value);
}

int64_t ToAmount(uint64_t value) {
  if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    throw util::InvalidArgument("insert asset: amount out of range: " + std::to_string(value));
  }
  return static_cast<int64_t>(value);
}

} // namespace

AssetImporter::AssetImporter(db::Repository& repo)
    : repo_(repo),
      internal_keys_(repo),
      script_keys_(repo, internal_keys_),
      group_keys_(repo, internal_keys_),
      genesis_(repo) {
}

ImportResult AssetImporter::ImportAssetBatch(const util::Context&             ctx,
                                             db::Transaction&                 tx,
                                             const model::OutPoint&           genesis_outpoint,
                                             const std::vector<model::Asset>& assets,
                                             const AnchorRefs&                anchor_refs) {
  const bool anchored = anchor_refs.size() == assets.size();

  // Asset ids hash the genesis outpoint; every asset must share the batch one.
  for (const auto& asset : assets) {
    if (asset.genesis.first_prev_out != genesis_outpoint) {
      throw util::InvalidArgument("insert genesis asset: genesis outpoint differs from batch outpoint");
    }
  }

  ImportResult result;
  result.genesis_point_id = genesis_.UpsertGenesisPoint(ctx, tx, genesis_outpoint);
  result.asset_ids.reserve(assets.size());

  for (std::size_t i = 0; i < assets.size(); ++i) {
    const auto anchor_ref = anchored ? anchor_refs[i] : std::nullopt;
    result.asset_ids.push_back(InsertAsset(ctx, tx, result.genesis_point_id, assets[i], anchor_ref));
  }
  return result;
}

model::Genesis AssetImporter::FetchGenesis(const util::Context& ctx, db::Transaction& tx, int64_t gen_asset_id) {
  return genesis_.FetchGenesisByID(ctx, tx, gen_asset_id);
}

int64_t AssetImporter::InsertAsset(const util::Context&          ctx,
                                   db::Transaction&              tx,
                                   int64_t                       genesis_point_id,
                                   const model::Asset&           asset,
                                   const std::optional<int64_t>& anchor_ref) {
  const int64_t gen_asset_id  = genesis_.UpsertGenesisAsset(ctx, tx, genesis_point_id, asset.genesis);
  const auto    group_sig_id  = group_keys_.Upsert(ctx, tx, asset.group_key, genesis_point_id, gen_asset_id);
  const int64_t script_key_id = script_keys_.Upsert(ctx, tx, asset.script_key);

  db::model::AssetRecord record;
  record.genesis_id         = gen_asset_id;
  record.version            = ToInt32(asset.version, "version");
  record.script_key_id      = script_key_id;
  record.asset_group_sig_id = group_sig_id;
  record.script_version     = ToInt32(asset.script_version, "script version");
  record.amount             = ToAmount(asset.amount);
  record.lock_time          = ToLockTime(asset.lock_time, "lock time");
  record.relative_lock_time = ToLockTime(asset.relative_lock_time, "relative lock time");
  record.anchor_utxo_id     = anchor_ref;

  ctx.Check("insert asset");
  ThrowIfDbError(repo_.InsertNewAsset(tx, record), "insert asset");
  return record.asset_id;
}

} // namespace assetdb::core
