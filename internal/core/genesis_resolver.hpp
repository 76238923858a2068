#pragma once

#include <cstdint>

#include "internal/db/api/repository.hpp"
#include "internal/model/genesis.hpp"
#include "internal/model/outpoint.hpp"
#include "internal/util/context.hpp"

namespace assetdb::core {

class GenesisResolver {
 public:
  explicit GenesisResolver(db::Repository& repo);

  int64_t UpsertGenesisPoint(const util::Context& ctx, db::Transaction& tx, const model::OutPoint& outpoint);

  // Derives the asset id from the genesis fields before upserting.
  int64_t UpsertGenesisAsset(const util::Context& ctx,
                             db::Transaction&     tx,
                             int64_t              genesis_point_id,
                             const model::Genesis& genesis);

  // Throws util::NotFound on a miss and util::EncodingError when the
  // stored outpoint or asset type cannot be decoded.
  model::Genesis FetchGenesisByID(const util::Context& ctx, db::Transaction& tx, int64_t gen_asset_id);

 private:
  db::Repository& repo_;
};

} // namespace assetdb::core
