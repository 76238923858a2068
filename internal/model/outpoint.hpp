#pragma once

#include <array>
#include <cstdint>

namespace assetdb::model {

// Reference to one output of a previous transaction.
struct OutPoint {
  std::array<uint8_t, 32> hash{};
  uint32_t                index = 0;

  bool operator==(const OutPoint&) const = default;
};

} // namespace assetdb::model
