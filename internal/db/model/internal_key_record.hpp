#pragma once

#include <cstdint>

#include "internal/util/bytes.hpp"

namespace assetdb::db::model {

/*
  Raw key plus its wallet derivation locator.

  key_family/key_index are zero when the derivation path is unknown
  (a key observed in a foreign proof). Identity is raw_key.
*/

struct InternalKeyRecord {
  int64_t     key_id = 0; // filled by upsert
  util::Bytes raw_key;
  int32_t     key_family = 0;
  int32_t     key_index  = 0;
};

} // namespace assetdb::db::model
