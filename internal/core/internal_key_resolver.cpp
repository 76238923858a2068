#include "internal_key_resolver.hpp"

#include <limits>
#include <string>

#include "internal/core/store_errors.hpp"
#include "internal/util/errors.hpp"

namespace assetdb::core {

namespace {

// Locators are stored in signed INTEGER columns.
int32_t ToLocatorField(uint32_t value, const char* field) {
  if (value > static_cast<uint32_t>(std::numeric_limits<int32_t>::max())) {
    throw util::InvalidArgument(std::string("insert internal key: ") + field + " out of range: " + std::to_string(value));
  }
  return static_cast<int32_t>(value);
}

} // namespace

InternalKeyResolver::InternalKeyResolver(db::Repository& repo) : repo_(repo) {
}

int64_t InternalKeyResolver::Upsert(const util::Context& ctx, db::Transaction& tx, const util::Bytes& raw_key,
                                    const model::KeyLocator& locator) {
  if (raw_key.empty()) {
    throw util::InvalidArgument("insert internal key: raw key is empty");
  }
  ctx.Check("insert internal key");

  db::model::InternalKeyRecord record;
  record.raw_key    = raw_key;
  record.key_family = ToLocatorField(locator.family, "key family");
  record.key_index  = ToLocatorField(locator.index, "key index");
  ThrowIfDbError(repo_.UpsertInternalKey(tx, record), "insert internal key");
  return record.key_id;
}

} // namespace assetdb::core
