#pragma once

#include <cstdint>
#include <optional>

#include "internal/model/genesis.hpp"
#include "internal/model/keys.hpp"

namespace assetdb::model {

struct Asset {
  Genesis genesis;

  uint32_t  version = 0;
  ScriptKey script_key;

  // absent for assets that cannot be reissued
  std::optional<GroupKey> group_key;

  uint32_t script_version = 0;
  uint64_t amount         = 0;

  // zero means no lock; stored as NULL
  uint64_t lock_time          = 0;
  uint64_t relative_lock_time = 0;
};

} // namespace assetdb::model
