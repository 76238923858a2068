#include "store_errors.hpp"

#include "internal/util/errors.hpp"

namespace assetdb::core {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context + ": " + std::string(db::ToString(result.code))
                                              : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw util::StoreError(result.code, message);
  }
}

} // namespace assetdb::core
