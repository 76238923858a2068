#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "internal/core/genesis_resolver.hpp"
#include "internal/core/group_key_resolver.hpp"
#include "internal/core/internal_key_resolver.hpp"
#include "internal/core/script_key_resolver.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/asset.hpp"
#include "internal/util/context.hpp"

namespace assetdb::core {

// Anchor output row per asset, parallel to the asset list.
using AnchorRefs = std::vector<std::optional<int64_t>>;

struct ImportResult {
  int64_t              genesis_point_id = 0;
  std::vector<int64_t> asset_ids; // input order
};

/*
  AssetImporter

  Writes one batch of assets minted from a single genesis outpoint.
  Per asset, rows are written in foreign key order:

    genesis asset -> group key / group sig -> script key -> asset

  The caller owns the transaction; any exception leaves it to be rolled
  back, so a batch is either fully written or not at all.
*/
class AssetImporter {
 public:
  explicit AssetImporter(db::Repository& repo);

  // anchor_refs is only used when it has one entry per asset; any other
  // length imports every asset unanchored.
  ImportResult ImportAssetBatch(const util::Context&             ctx,
                                db::Transaction&                 tx,
                                const model::OutPoint&           genesis_outpoint,
                                const std::vector<model::Asset>& assets,
                                const AnchorRefs&                anchor_refs);

  model::Genesis FetchGenesis(const util::Context& ctx, db::Transaction& tx, int64_t gen_asset_id);

 private:
  int64_t InsertAsset(const util::Context&          ctx,
                      db::Transaction&              tx,
                      int64_t                       genesis_point_id,
                      const model::Asset&           asset,
                      const std::optional<int64_t>& anchor_ref);

  db::Repository&     repo_;
  InternalKeyResolver internal_keys_;
  ScriptKeyResolver   script_keys_;
  GroupKeyResolver    group_keys_;
  GenesisResolver     genesis_;
};

} // namespace assetdb::core
