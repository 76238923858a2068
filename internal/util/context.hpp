#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string_view>

#include "internal/util/time.hpp"

namespace assetdb::util {

/*
  Context

  Cancellation and deadline handed down by the caller. Core operations
  call Check() before every store call; a cancelled or expired context
  throws util::Cancelled and the surrounding transaction rolls back.

  Copies share the cancellation flag, so a caller can keep one copy
  and Cancel() it from another thread.
*/
class Context {
 public:
  Context();

  static Context Background();
  static Context WithTimeout(Clock::duration timeout);
  static Context WithDeadline(TimePoint deadline);

  void Cancel();

  bool IsCancelled() const;
  bool IsExpired() const;

  const std::optional<TimePoint>& Deadline() const {
    return deadline_;
  }

  // Throws util::Cancelled naming the operation that was interrupted.
  void Check(std::string_view operation) const;

 private:
  std::shared_ptr<std::atomic<bool>> cancelled_;
  std::optional<TimePoint>           deadline_;
};

} // namespace assetdb::util
