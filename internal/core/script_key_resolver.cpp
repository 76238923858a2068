#include "script_key_resolver.hpp"

#include <variant>

#include "internal/core/store_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace assetdb::core {

ScriptKeyResolver::ScriptKeyResolver(db::Repository& repo, InternalKeyResolver& internal_keys)
    : repo_(repo), internal_keys_(internal_keys) {
}

int64_t ScriptKeyResolver::Upsert(const util::Context& ctx, db::Transaction& tx, const model::ScriptKey& key) {
  const auto* derived = std::get_if<model::DerivedScriptKey>(&key);
  ASSETDB_LOG_DEBUG("resolving script key", {observability::StringField("tweaked_key", util::ToHex(model::TweakedKey(key))),
                                             observability::BoolField("derived", derived != nullptr)});
  if (derived) {
    return UpsertDerived(ctx, tx, *derived);
  }
  return UpsertObserved(ctx, tx, std::get<model::ObservedScriptKey>(key));
}

int64_t ScriptKeyResolver::UpsertDerived(const util::Context& ctx, db::Transaction& tx, const model::DerivedScriptKey& key) {
  if (key.tweaked_key.empty()) {
    throw util::InvalidArgument("insert script key: tweaked key is empty");
  }
  const int64_t internal_key_id = internal_keys_.Upsert(ctx, tx, key.raw_key);

  ctx.Check("insert script key");
  db::model::ScriptKeyRecord record;
  record.internal_key_id    = internal_key_id;
  record.tweaked_script_key = key.tweaked_key;
  record.tweak              = key.tweak;
  ThrowIfDbError(repo_.UpsertScriptKey(tx, record), "insert script key");
  return record.script_key_id;
}

int64_t ScriptKeyResolver::UpsertObserved(const util::Context& ctx, db::Transaction& tx, const model::ObservedScriptKey& key) {
  if (key.tweaked_key.empty()) {
    throw util::InvalidArgument("insert script key: tweaked key is empty");
  }

  ctx.Check("fetch script key");
  int64_t    script_key_id = 0;
  const auto lookup        = repo_.FetchScriptKeyIDByTweakedKey(tx, key.tweaked_key, script_key_id);
  if (lookup) {
    return script_key_id;
  }
  if (lookup.code != db::ErrorCode::NotFound) {
    ThrowIfDbError(lookup, "fetch script key");
  }

  ASSETDB_LOG_WARN("importing foreign script key as placeholder internal key",
                   {observability::StringField("tweaked_key", util::ToHex(key.tweaked_key))});

  const int64_t internal_key_id = internal_keys_.Upsert(ctx, tx, key.tweaked_key, model::KeyLocator{});

  ctx.Check("insert script key");
  db::model::ScriptKeyRecord record;
  record.internal_key_id    = internal_key_id;
  record.tweaked_script_key = key.tweaked_key;
  ThrowIfDbError(repo_.UpsertScriptKey(tx, record), "insert script key");
  return record.script_key_id;
}

} // namespace assetdb::core
