#include "group_key_resolver.hpp"

#include "internal/core/store_errors.hpp"
#include "internal/util/errors.hpp"

namespace assetdb::core {

GroupKeyResolver::GroupKeyResolver(db::Repository& repo, InternalKeyResolver& internal_keys)
    : repo_(repo), internal_keys_(internal_keys) {
}

std::optional<int64_t> GroupKeyResolver::Upsert(const util::Context&                  ctx,
                                                db::Transaction&                      tx,
                                                const std::optional<model::GroupKey>& group_key,
                                                int64_t                               genesis_point_id,
                                                int64_t                               gen_asset_id) {
  if (!group_key) {
    return std::nullopt;
  }
  if (group_key->group_pub_key.empty()) {
    throw util::InvalidArgument("insert group key: group public key is empty");
  }

  const auto raw_key = group_key->raw_key.value_or(model::KeyDescriptor{group_key->group_pub_key, {}});
  const int64_t internal_key_id = internal_keys_.Upsert(ctx, tx, raw_key);

  ctx.Check("insert group key");
  db::model::GroupKeyRecord key_record;
  key_record.tweaked_group_key = group_key->group_pub_key;
  key_record.internal_key_id   = internal_key_id;
  key_record.genesis_point_id  = genesis_point_id;
  ThrowIfDbError(repo_.UpsertAssetGroupKey(tx, key_record), "insert group key");

  ctx.Check("insert group sig");
  db::model::GroupSigRecord sig_record;
  sig_record.genesis_sig  = group_key->sig;
  sig_record.gen_asset_id = gen_asset_id;
  sig_record.group_key_id = key_record.group_id;
  ThrowIfDbError(repo_.UpsertAssetGroupSig(tx, sig_record), "insert group sig");

  return sig_record.sig_id;
}

} // namespace assetdb::core
