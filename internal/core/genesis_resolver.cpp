#include "genesis_resolver.hpp"

#include <string>

#include "internal/core/store_errors.hpp"
#include "internal/util/errors.hpp"
#include "internal/wire/outpoint_codec.hpp"

namespace assetdb::core {

namespace {

model::AssetType DecodeAssetType(int16_t stored) {
  switch (stored) {
    case static_cast<int16_t>(model::AssetType::kNormal):
      return model::AssetType::kNormal;
    case static_cast<int16_t>(model::AssetType::kCollectible):
      return model::AssetType::kCollectible;
    default:
      throw util::EncodingError("fetch genesis: unknown asset type " + std::to_string(stored));
  }
}

} // namespace

GenesisResolver::GenesisResolver(db::Repository& repo) : repo_(repo) {
}

int64_t GenesisResolver::UpsertGenesisPoint(const util::Context& ctx, db::Transaction& tx, const model::OutPoint& outpoint) {
  ctx.Check("insert genesis point");

  db::model::GenesisPointRecord record;
  record.prev_out = wire::EncodeOutPoint(outpoint);
  ThrowIfDbError(repo_.UpsertGenesisPoint(tx, record), "insert genesis point");
  return record.genesis_id;
}

int64_t GenesisResolver::UpsertGenesisAsset(const util::Context& ctx,
                                            db::Transaction&     tx,
                                            int64_t              genesis_point_id,
                                            const model::Genesis& genesis) {
  ctx.Check("insert genesis asset");

  const auto asset_id = genesis.Id();

  db::model::GenesisAssetRecord record;
  record.asset_id         = util::Bytes(asset_id.begin(), asset_id.end());
  record.asset_tag        = genesis.tag;
  record.meta_data        = genesis.metadata;
  record.output_index     = static_cast<int32_t>(genesis.output_index);
  record.asset_type       = static_cast<int16_t>(genesis.type);
  record.genesis_point_id = genesis_point_id;
  ThrowIfDbError(repo_.UpsertGenesisAsset(tx, record), "insert genesis asset");
  return record.gen_asset_id;
}

model::Genesis GenesisResolver::FetchGenesisByID(const util::Context& ctx, db::Transaction& tx, int64_t gen_asset_id) {
  ctx.Check("fetch genesis");

  db::model::GenesisRecord record;
  ThrowIfDbError(repo_.FetchGenesisByID(tx, gen_asset_id, record), "fetch genesis " + std::to_string(gen_asset_id));

  model::Genesis genesis;
  try {
    genesis.first_prev_out = wire::DecodeOutPoint(record.prev_out);
  } catch (const util::EncodingError& e) {
    throw util::EncodingError("fetch genesis " + std::to_string(gen_asset_id) + ": " + e.what());
  }
  genesis.tag          = record.asset_tag;
  genesis.metadata     = record.meta_data;
  genesis.output_index = static_cast<uint32_t>(record.output_index);
  genesis.type         = DecodeAssetType(record.asset_type);
  return genesis;
}

} // namespace assetdb::core
