#pragma once

#include "flakeid/core/time.h"

#include <atomic>
#include <cstdint>

namespace flakeid::core {

// Abstract clock interface for time injection.
// Allows production code to use system time while tests drive time by hand.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return current wall-clock time as milliseconds since the Unix epoch.
  // Contract: safe to call concurrently from multiple threads.
  virtual std::int64_t now_unix_millis() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time truncated to milliseconds.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::int64_t now_unix_millis() override;
};

// Manual clock: returns whatever time it was last set to.
// For deterministic tests; may be moved backwards to simulate NTP corrections.
// Thread-safe (atomic), so one thread may advance it while another spins on it.
class ManualClock final : public IClock {
 public:
  explicit ManualClock(std::int64_t unix_millis) : millis_(unix_millis) {}
  ~ManualClock() override = default;

  // Not copyable or movable (contains atomic)
  ManualClock(const ManualClock&) = delete;
  ManualClock& operator=(const ManualClock&) = delete;
  ManualClock(ManualClock&&) = delete;
  ManualClock& operator=(ManualClock&&) = delete;

  std::int64_t now_unix_millis() override;

  void set(std::int64_t unix_millis);
  void advance(std::int64_t delta_millis);

 private:
  std::atomic<std::int64_t> millis_;
};

// system_clock returns the process-wide SystemClock used when no clock is injected.
IClock& system_clock();

}  // namespace flakeid::core
