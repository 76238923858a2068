#include "context.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace assetdb::util {

Context::Context() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {
}

Context Context::Background() {
  return Context();
}

Context Context::WithTimeout(Clock::duration timeout) {
  return WithDeadline(Now() + timeout);
}

Context Context::WithDeadline(TimePoint deadline) {
  Context ctx;
  ctx.deadline_ = deadline;
  return ctx;
}

void Context::Cancel() {
  cancelled_->store(true, std::memory_order_release);
}

bool Context::IsCancelled() const {
  return cancelled_->load(std::memory_order_acquire);
}

bool Context::IsExpired() const {
  return deadline_.has_value() && Now() >= *deadline_;
}

void Context::Check(std::string_view operation) const {
  if (IsCancelled()) {
    throw Cancelled(std::string(operation) + ": context cancelled");
  }
  if (IsExpired()) {
    throw Cancelled(std::string(operation) + ": deadline exceeded");
  }
}

} // namespace assetdb::util
