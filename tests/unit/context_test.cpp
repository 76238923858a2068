#include "internal/util/context.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "internal/util/errors.hpp"

namespace {

using assetdb::util::Context;

bool Throws(const Context& ctx) {
  try {
    ctx.Check("test op");
  } catch (const assetdb::util::Cancelled& e) {
    assert(std::string(e.what()).find("test op") != std::string::npos);
    return true;
  }
  return false;
}

void TestBackgroundNeverExpires() {
  auto ctx = Context::Background();
  assert(!ctx.IsCancelled());
  assert(!ctx.IsExpired());
  assert(!ctx.Deadline().has_value());
  assert(!Throws(ctx));
}

void TestCancelIsSharedByCopies() {
  auto ctx  = Context::Background();
  auto copy = ctx;
  ctx.Cancel();
  assert(copy.IsCancelled());
  assert(Throws(copy));
}

void TestCancelFromAnotherThread() {
  auto        ctx = Context::Background();
  std::thread canceller([ctx]() mutable { ctx.Cancel(); });
  canceller.join();
  assert(Throws(ctx));
}

void TestDeadline() {
  auto expired = Context::WithTimeout(std::chrono::milliseconds(-1));
  assert(expired.IsExpired());
  assert(Throws(expired));

  auto later = Context::WithTimeout(std::chrono::hours(1));
  assert(!later.IsExpired());
  assert(!Throws(later));
}

} // namespace

int main() {
  TestBackgroundNeverExpires();
  TestCancelIsSharedByCopies();
  TestCancelFromAnotherThread();
  TestDeadline();

  std::cout << "assetdb_unit_context: pass\n";
  return 0;
}
