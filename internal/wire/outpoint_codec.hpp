#pragma once

#include <cstddef>

#include "internal/model/outpoint.hpp"
#include "internal/util/bytes.hpp"

namespace assetdb::wire {

/*
  Outpoint wire form: 32 byte txid followed by the output index as a
  little-endian uint32, 36 bytes total. This is the form stored in
  genesis_points.prev_out.
*/

inline constexpr std::size_t kOutPointSize = 36;

util::Bytes EncodeOutPoint(const model::OutPoint& op);

// Throws util::EncodingError unless bytes is exactly kOutPointSize long.
model::OutPoint DecodeOutPoint(const util::Bytes& bytes);

} // namespace assetdb::wire
