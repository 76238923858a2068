#pragma once

#include <cstdint>
#include <optional>

namespace assetdb::db::model {

/*
  Final asset row. Every referenced row must already exist in the same
  transaction: genesis asset, script key and (optionally) group sig.

  anchor_utxo_id points into the anchoring subsystem's table and is
  not constrained here.
*/

struct AssetRecord {
  int64_t                asset_id      = 0; // filled by insert
  int64_t                genesis_id    = 0;
  int32_t                version       = 0;
  int64_t                script_key_id = 0;
  std::optional<int64_t> asset_group_sig_id;
  int32_t                script_version = 0;
  int64_t                amount         = 0;
  std::optional<int32_t> lock_time;
  std::optional<int32_t> relative_lock_time;
  std::optional<int64_t> anchor_utxo_id;
};

} // namespace assetdb::db::model
