#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace assetdb::util {

/*
  Raw byte buffers.

  Keys, signatures, tweaks and encoded outpoints are all opaque blobs
  at this layer; the hex helpers exist for log fields and the CLI.
*/

using Bytes = std::vector<uint8_t>;

std::string ToHex(const uint8_t* data, std::size_t size);
std::string ToHex(const Bytes& bytes);

// Throws util::EncodingError on odd length or non-hex characters.
Bytes FromHex(std::string_view hex);

} // namespace assetdb::util
