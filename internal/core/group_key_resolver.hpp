#pragma once

#include <cstdint>
#include <optional>

#include "internal/core/internal_key_resolver.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/keys.hpp"
#include "internal/util/context.hpp"

namespace assetdb::core {

/*
  Writes the reissuance side of an asset: the group key row and the
  signature tying one genesis asset to it.

  The group key is owned by an internal key. When the raw key is
  unknown (group imported from a remote proof) the tweaked group key
  stands in for it, as with observed script keys.
*/
class GroupKeyResolver {
 public:
  GroupKeyResolver(db::Repository& repo, InternalKeyResolver& internal_keys);

  // Returns the group sig id, or nullopt without writing anything when
  // the asset has no group key.
  std::optional<int64_t> Upsert(const util::Context&                  ctx,
                                db::Transaction&                      tx,
                                const std::optional<model::GroupKey>& group_key,
                                int64_t                               genesis_point_id,
                                int64_t                               gen_asset_id);

 private:
  db::Repository&      repo_;
  InternalKeyResolver& internal_keys_;
};

} // namespace assetdb::core
