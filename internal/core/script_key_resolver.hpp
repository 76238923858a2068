#pragma once

#include <cstdint>

#include "internal/core/internal_key_resolver.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/keys.hpp"
#include "internal/util/context.hpp"

namespace assetdb::core {

/*
  ScriptKeyResolver

  Two provenance paths, picked by the ScriptKey alternative:

  - DerivedScriptKey: the wallet knows the raw key. Upsert its internal
    key with the real locator, then the script key with its tweak.

  - ObservedScriptKey: only the tweaked key is known (proof imported
    from another node). Reuse an existing script key if this tweaked key
    was seen before. Otherwise store the tweaked key itself as a
    placeholder internal key with a zero locator, so the foreign key is
    satisfied; the wallet cannot sign with it.
*/
class ScriptKeyResolver {
 public:
  ScriptKeyResolver(db::Repository& repo, InternalKeyResolver& internal_keys);

  int64_t Upsert(const util::Context& ctx, db::Transaction& tx, const model::ScriptKey& key);

 private:
  int64_t UpsertDerived(const util::Context& ctx, db::Transaction& tx, const model::DerivedScriptKey& key);
  int64_t UpsertObserved(const util::Context& ctx, db::Transaction& tx, const model::ObservedScriptKey& key);

  db::Repository&      repo_;
  InternalKeyResolver& internal_keys_;
};

} // namespace assetdb::core
