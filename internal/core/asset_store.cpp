#include "asset_store.hpp"

#include <exception>
#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/bytes.hpp"
#include "internal/util/time.hpp"

namespace assetdb::core {

namespace {

std::string OutPointString(const model::OutPoint& outpoint) {
  return util::ToHex(outpoint.hash.data(), outpoint.hash.size()) + ":" + std::to_string(outpoint.index);
}

std::shared_ptr<db::Repository> RequireRepository(std::shared_ptr<db::Repository> repository) {
  if (!repository) {
    throw std::invalid_argument("AssetStore requires a repository");
  }
  return repository;
}

} // namespace

AssetStore::AssetStore(std::shared_ptr<db::Repository> repository)
    : repository_(RequireRepository(std::move(repository))), importer_(*repository_) {
}

ImportResult AssetStore::ImportAssetBatch(const util::Context&             ctx,
                                          const model::OutPoint&           genesis_outpoint,
                                          const std::vector<model::Asset>& assets,
                                          const AnchorRefs&                anchor_refs) {
  const auto start = util::Now();
  try {
    auto tx     = repository_->Begin();
    auto result = importer_.ImportAssetBatch(ctx, *tx, genesis_outpoint, assets, anchor_refs);

    ctx.Check("commit asset batch");
    tx->Commit();

    ASSETDB_LOG_INFO("imported asset batch",
                     {observability::StringField("outpoint", OutPointString(genesis_outpoint)),
                      observability::IntField("genesis_point_id", result.genesis_point_id),
                      observability::IntField("assets", static_cast<int64_t>(result.asset_ids.size())),
                      observability::IntField("elapsed_ms", util::MillisSince(start))});
    return result;
  } catch (const std::exception& e) {
    ASSETDB_LOG_WARN("asset batch aborted",
                     {observability::StringField("outpoint", OutPointString(genesis_outpoint)),
                      observability::IntField("assets", static_cast<int64_t>(assets.size())),
                      observability::StringField("error", e.what())});
    throw;
  }
}

ImportResult AssetStore::ImportAssetBatch(const util::Context&             ctx,
                                          db::Transaction&                 tx,
                                          const model::OutPoint&           genesis_outpoint,
                                          const std::vector<model::Asset>& assets,
                                          const AnchorRefs&                anchor_refs) {
  return importer_.ImportAssetBatch(ctx, tx, genesis_outpoint, assets, anchor_refs);
}

model::Genesis AssetStore::FetchGenesis(const util::Context& ctx, int64_t gen_asset_id) {
  auto tx      = repository_->Begin();
  auto genesis = importer_.FetchGenesis(ctx, *tx, gen_asset_id);
  tx->Commit();
  return genesis;
}

} // namespace assetdb::core
