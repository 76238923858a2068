#pragma once

#include <cassert>
#include <cstdint>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/model/asset.hpp"

namespace assetdb::testing {

// 33 byte compressed-key shaped blob; distinct seeds give distinct keys.
inline util::Bytes Key(uint8_t seed, uint8_t prefix = 0x02) {
  util::Bytes key(33, seed);
  key[0] = prefix;
  return key;
}

inline model::OutPoint OutPointFor(uint8_t seed, uint32_t index = 0) {
  model::OutPoint op;
  op.hash.fill(seed);
  op.index = index;
  return op;
}

inline model::Genesis GenesisFor(const model::OutPoint& outpoint, const std::string& tag, uint32_t output_index = 0) {
  model::Genesis genesis;
  genesis.first_prev_out = outpoint;
  genesis.tag            = tag;
  genesis.metadata       = util::Bytes(tag.begin(), tag.end());
  genesis.output_index   = output_index;
  genesis.type           = model::AssetType::kNormal;
  return genesis;
}

inline model::ScriptKey Derived(uint8_t raw_seed, uint8_t tweaked_seed, uint32_t family = 1, uint32_t index = 0) {
  model::DerivedScriptKey key;
  key.raw_key     = model::KeyDescriptor{Key(raw_seed), model::KeyLocator{family, index}};
  key.tweaked_key = Key(tweaked_seed, 0x03);
  key.tweak       = util::Bytes(32, tweaked_seed);
  return key;
}

inline model::ScriptKey Observed(uint8_t tweaked_seed) {
  return model::ObservedScriptKey{Key(tweaked_seed, 0x03)};
}

inline model::GroupKey GroupFor(uint8_t seed) {
  model::GroupKey group;
  group.group_pub_key = Key(seed, 0x02);
  group.sig           = util::Bytes(64, seed);
  return group;
}

inline model::Asset AssetFor(const model::Genesis& genesis, const model::ScriptKey& script_key, uint64_t amount = 100) {
  model::Asset asset;
  asset.genesis    = genesis;
  asset.script_key = script_key;
  asset.amount     = amount;
  return asset;
}

inline int64_t Count(db::Repository& repo, std::string_view table) {
  auto    tx    = repo.Begin();
  int64_t count = -1;
  const auto result = repo.CountRows(*tx, table, count);
  assert(result);
  (void)result;
  tx->Rollback();
  return count;
}

} // namespace assetdb::testing
