#include "flakeid/snowflake/generator.h"

#include "flakeid/snowflake/layout.h"

#include <utility>

namespace flakeid::snowflake {

std::string to_string(const GenerationError error) {
  switch (error) {
    case GenerationError::kClockMovedBackwards:
      return "clock moved backwards";
    case GenerationError::kClockBeforeEpoch:
      return "clock is before the configured epoch";
    case GenerationError::kTimestampOverflow:
      return "timestamp exceeds the 41-bit field; choose a later epoch";
  }
  return "unknown generation error";
}

core::Result<std::unique_ptr<Generator>, ConfigurationError> Generator::create(
    const std::vector<Option>& options, core::IClock& clock) {
  auto config = apply_options(options);
  if (!config.has_value()) {
    return core::Result<std::unique_ptr<Generator>, ConfigurationError>::err(config.error());
  }
  return core::Result<std::unique_ptr<Generator>, ConfigurationError>::ok(
      std::make_unique<Generator>(config.value(), clock));
}

Generator::Generator(GeneratorConfig config, core::IClock& clock)
    : config_(std::move(config)),
      epoch_offset_millis_(config_.epoch_offset_millis()),
      clock_(clock) {}

GenerateResult Generator::try_next() {
  std::lock_guard<std::mutex> lock(mutex_);

  auto millis = clock_.now_unix_millis();
  if (millis < last_millis_) {
    return GenerateResult::err(GenerationError::kClockMovedBackwards);
  }

  if (millis == last_millis_) {
    sequence_ = (sequence_ + 1) & kMaxSequence;
    if (sequence_ == 0) {
      // Sequence space for this millisecond is spent
      millis = wait_for_next_millis();
    }
  } else {
    sequence_ = 0;
  }
  last_millis_ = millis;

  if (millis < epoch_offset_millis_) {
    return GenerateResult::err(GenerationError::kClockBeforeEpoch);
  }

  // A larger delta would reach the sign bit and collide with the -1 sentinel.
  const auto delta = millis - epoch_offset_millis_;
  if (delta > kMaxTimestamp) {
    return GenerateResult::err(GenerationError::kTimestampOverflow);
  }

  return GenerateResult::ok(
      compose(IdParts{delta, config_.data_center, config_.worker, sequence_}));
}

std::int64_t Generator::next() {
  const auto result = try_next();
  if (!result.has_value()) {
    return kInvalidId;
  }
  return result.value();
}

std::string Generator::next_string() { return std::to_string(next()); }

std::int64_t Generator::wait_for_next_millis() {
  auto millis = clock_.now_unix_millis();
  while (millis <= last_millis_) {
    millis = clock_.now_unix_millis();
  }
  return millis;
}

}  // namespace flakeid::snowflake
