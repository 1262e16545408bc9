#pragma once

#include "flakeid/core/clock.h"
#include "flakeid/core/result.h"
#include "flakeid/snowflake/options.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace flakeid::snowflake {

// Why a call could not issue an identifier. No automatic recovery is attempted;
// callers retry once the clock has caught up.
enum class GenerationError {
  kClockMovedBackwards,  // wall clock is behind the last issued millisecond
  kClockBeforeEpoch,     // wall clock is behind the configured epoch offset
  kTimestampOverflow,    // delta from the epoch no longer fits kTimestampBits
};

[[nodiscard]] std::string to_string(GenerationError error);

using GenerateResult = core::Result<std::int64_t, GenerationError>;

// Generator issues time-ordered 64-bit identifiers for one (data center, worker) identity.
//
// Thread-safety: one mutex covers every call to try_next(), so concurrent callers serialize.
// Ordering: identifiers from one instance strictly increase while the clock never regresses.
// Exhaustion: after kMaxSequence + 1 ids in one millisecond, the next call spins on the clock
// (no sleep) until a later millisecond is observed.
//
// The clock is held by reference and must outlive the generator.
class Generator {
 public:
  [[nodiscard]] static core::Result<std::unique_ptr<Generator>, ConfigurationError> create(
      const std::vector<Option>& options, core::IClock& clock = core::system_clock());

  Generator(GeneratorConfig config, core::IClock& clock);
  ~Generator() = default;

  // Disable copy/move (mutex not copyable)
  Generator(const Generator&) = delete;
  Generator& operator=(const Generator&) = delete;
  Generator(Generator&&) = delete;
  Generator& operator=(Generator&&) = delete;

  [[nodiscard]] GenerateResult try_next();

  // next returns kInvalidId (-1) instead of an error value.
  [[nodiscard]] std::int64_t next();

  // Decimal rendering of next(); "-1" on failure.
  [[nodiscard]] std::string next_string();

  [[nodiscard]] const GeneratorConfig& config() const { return config_; }
  [[nodiscard]] std::int64_t epoch_offset_millis() const { return epoch_offset_millis_; }

 private:
  std::int64_t wait_for_next_millis();

  const GeneratorConfig config_;
  const std::int64_t epoch_offset_millis_;
  core::IClock& clock_;

  std::mutex mutex_;
  std::int64_t last_millis_{0};  // guarded by mutex_
  std::int64_t sequence_{0};     // guarded by mutex_
};

}  // namespace flakeid::snowflake
