#pragma once

#include <cstdint>

#include "internal/util/bytes.hpp"

namespace assetdb::db::model {

/*
  Outpoint that seeds a batch of assets.

  prev_out is the 36 byte wire encoding; identity is the encoded bytes.
*/

struct GenesisPointRecord {
  int64_t     genesis_id = 0; // filled by upsert
  util::Bytes prev_out;
};

} // namespace assetdb::db::model
