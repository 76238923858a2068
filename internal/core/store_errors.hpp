#pragma once

#include <string>

#include "internal/db/api/result.hpp"

namespace assetdb::core {

// Converts a failed repository result into the util:: exception for its
// kind. context names the operation and entity, e.g. "insert script key".
void ThrowIfDbError(const db::Result& result, const std::string& context);

} // namespace assetdb::core
