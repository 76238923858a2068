#pragma once

#include <cstdint>

#include "internal/util/bytes.hpp"

namespace assetdb::db::model {

/*
  Reissuance key. One group key may back many genesis assets over time;
  each of them is linked through its own GroupSigRecord.
*/

struct GroupKeyRecord {
  int64_t     group_id = 0; // filled by upsert
  util::Bytes tweaked_group_key;
  int64_t     internal_key_id  = 0;
  int64_t     genesis_point_id = 0;
};

struct GroupSigRecord {
  int64_t     sig_id = 0; // filled by upsert
  util::Bytes genesis_sig;
  int64_t     gen_asset_id = 0;
  int64_t     group_key_id = 0;
};

} // namespace assetdb::db::model
