#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "internal/core/asset_importer.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/asset.hpp"
#include "internal/util/context.hpp"

namespace assetdb::core {

/*
  AssetStore

  Entry point for callers. Each call without a transaction opens its
  own and commits only after every step succeeded; on any exception the
  transaction is rolled back and the exception propagates unchanged.

  Thread-safe as long as the repository is: the store holds no state
  between calls.
*/
class AssetStore {
 public:
  explicit AssetStore(std::shared_ptr<db::Repository> repository);

  ImportResult ImportAssetBatch(const util::Context&             ctx,
                                const model::OutPoint&           genesis_outpoint,
                                const std::vector<model::Asset>& assets,
                                const AnchorRefs&                anchor_refs = {});

  // Runs inside a transaction owned by the caller; nothing is committed.
  ImportResult ImportAssetBatch(const util::Context&             ctx,
                                db::Transaction&                 tx,
                                const model::OutPoint&           genesis_outpoint,
                                const std::vector<model::Asset>& assets,
                                const AnchorRefs&                anchor_refs = {});

  model::Genesis FetchGenesis(const util::Context& ctx, int64_t gen_asset_id);

  db::Repository& Repository() {
    return *repository_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  AssetImporter                   importer_;
};

} // namespace assetdb::core
