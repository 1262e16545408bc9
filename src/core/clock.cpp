#include "flakeid/core/clock.h"

namespace flakeid::core {

std::int64_t SystemClock::now_unix_millis() { return to_unix_millis(now_utc()); }

std::int64_t ManualClock::now_unix_millis() { return millis_.load(std::memory_order_acquire); }

void ManualClock::set(const std::int64_t unix_millis) {
  millis_.store(unix_millis, std::memory_order_release);
}

void ManualClock::advance(const std::int64_t delta_millis) {
  millis_.fetch_add(delta_millis, std::memory_order_acq_rel);
}

IClock& system_clock() {
  static SystemClock clock;
  return clock;
}

}  // namespace flakeid::core
