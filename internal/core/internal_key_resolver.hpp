#pragma once

#include <cstdint>

#include "internal/db/api/repository.hpp"
#include "internal/model/keys.hpp"
#include "internal/util/context.hpp"

namespace assetdb::core {

/*
  Upserts internal_keys rows and hands back their primary key.

  The same raw key always maps to the same row. See
  Repository::UpsertInternalKey for how differing locators reconcile.
*/
class InternalKeyResolver {
 public:
  explicit InternalKeyResolver(db::Repository& repo);

  // Throws util::InvalidArgument for an empty raw key.
  int64_t Upsert(const util::Context& ctx, db::Transaction& tx, const util::Bytes& raw_key, const model::KeyLocator& locator);

  int64_t Upsert(const util::Context& ctx, db::Transaction& tx, const model::KeyDescriptor& key) {
    return Upsert(ctx, tx, key.pub_key, key.locator);
  }

 private:
  db::Repository& repo_;
};

} // namespace assetdb::core
