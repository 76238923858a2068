#include "time.hpp"

namespace assetdb::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t MillisSince(TimePoint start) {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(Now() - start).count());
}

} // namespace assetdb::util
