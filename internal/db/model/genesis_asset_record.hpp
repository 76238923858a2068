#pragma once

#include <cstdint>
#include <string>

#include "internal/util/bytes.hpp"

namespace assetdb::db::model {

/*
  Immutable per-asset genesis row.

  asset_id is the 32 byte digest derived from the other fields plus the
  genesis outpoint; a second upsert with the same asset_id is a no-op.
*/

struct GenesisAssetRecord {
  int64_t     gen_asset_id = 0; // filled by upsert
  util::Bytes asset_id;
  std::string asset_tag;
  util::Bytes meta_data;
  int32_t     output_index     = 0;
  int16_t     asset_type       = 0;
  int64_t     genesis_point_id = 0;
};

// genesis_assets joined with its genesis point, as read back by id.
struct GenesisRecord {
  int64_t     gen_asset_id = 0;
  util::Bytes asset_id;
  std::string asset_tag;
  util::Bytes meta_data;
  int32_t     output_index = 0;
  int16_t     asset_type   = 0;
  util::Bytes prev_out;
};

} // namespace assetdb::db::model
