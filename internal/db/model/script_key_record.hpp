#pragma once

#include <cstdint>
#include <optional>

#include "internal/util/bytes.hpp"

namespace assetdb::db::model {

struct ScriptKeyRecord {
  int64_t     script_key_id   = 0; // filled by upsert
  int64_t     internal_key_id = 0;
  util::Bytes tweaked_script_key;

  // absent for keys imported from a foreign proof
  std::optional<util::Bytes> tweak;
};

} // namespace assetdb::db::model
