#include "outpoint_codec.hpp"

#include <algorithm>
#include <string>

#include "internal/util/errors.hpp"

namespace assetdb::wire {

util::Bytes EncodeOutPoint(const model::OutPoint& op) {
  util::Bytes out;
  out.reserve(kOutPointSize);
  out.insert(out.end(), op.hash.begin(), op.hash.end());
  out.push_back(static_cast<uint8_t>(op.index));
  out.push_back(static_cast<uint8_t>(op.index >> 8));
  out.push_back(static_cast<uint8_t>(op.index >> 16));
  out.push_back(static_cast<uint8_t>(op.index >> 24));
  return out;
}

model::OutPoint DecodeOutPoint(const util::Bytes& bytes) {
  if (bytes.size() != kOutPointSize) {
    throw util::EncodingError("outpoint must be " + std::to_string(kOutPointSize) + " bytes, got " +
                              std::to_string(bytes.size()));
  }

  model::OutPoint op;
  std::copy_n(bytes.begin(), op.hash.size(), op.hash.begin());
  op.index = static_cast<uint32_t>(bytes[32]) | (static_cast<uint32_t>(bytes[33]) << 8) |
             (static_cast<uint32_t>(bytes[34]) << 16) | (static_cast<uint32_t>(bytes[35]) << 24);
  return op;
}

} // namespace assetdb::wire
