#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "internal/model/outpoint.hpp"
#include "internal/util/bytes.hpp"

namespace assetdb::model {

enum class AssetType : uint8_t {
  kNormal      = 0,
  kCollectible = 1,
};

constexpr std::string_view ToString(AssetType type) {
  switch (type) {
    case AssetType::kNormal:
      return "normal";
    case AssetType::kCollectible:
      return "collectible";
    default:
      return "unknown";
  }
}

using AssetID = std::array<uint8_t, 32>;

/*
  Genesis

  Everything needed to derive an asset ID. Immutable once minted: the
  ID commits to the outpoint, the tag, the metadata, the output index
  and the asset type.
*/
struct Genesis {
  OutPoint    first_prev_out;
  std::string tag;
  util::Bytes metadata;
  uint32_t    output_index = 0;
  AssetType   type         = AssetType::kNormal;

  // sha256(outpoint || sha256(tag) || sha256(metadata) || output_index BE || type)
  AssetID Id() const;

  bool operator==(const Genesis&) const = default;
};

} // namespace assetdb::model
