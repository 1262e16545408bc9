#pragma once

#include "flakeid/core/result.h"
#include "flakeid/core/time.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace flakeid::snowflake {

// ConfigurationError reports an option value outside its allowed range.
// Construction fails fast; no generator is produced.
struct ConfigurationError {
  std::string field;      // NOLINT(readability-identifier-naming)
  std::int64_t value{0};  // NOLINT(readability-identifier-naming)
  std::int64_t min{0};    // NOLINT(readability-identifier-naming)
  std::int64_t max{0};    // NOLINT(readability-identifier-naming)

  // "<field> must be in [min, max], got value"
  [[nodiscard]] std::string message() const;
};

// GeneratorConfig holds the identity fields and epoch of one generator.
// Every field has an explicit default; an unset epoch means raw Unix milliseconds.
struct GeneratorConfig {
  std::int64_t data_center{0};           // NOLINT(readability-identifier-naming)
  std::int64_t worker{0};                // NOLINT(readability-identifier-naming)
  std::optional<core::Timestamp> epoch;  // NOLINT(readability-identifier-naming)

  [[nodiscard]] std::int64_t epoch_offset_millis() const;

  // True when both identity fields are still 0, which is unsafe across nodes.
  [[nodiscard]] bool uses_default_identity() const;
};

// Option mutates a GeneratorConfig, validating its own input.
using OptionResult = core::Result<bool, ConfigurationError>;
using Option = std::function<OptionResult(GeneratorConfig&)>;

// with_data_center sets the data center id; valid range [0, kMaxDataCenter].
[[nodiscard]] Option with_data_center(std::int64_t data_center);

// with_worker sets the worker id; valid range [0, kMaxWorker].
[[nodiscard]] Option with_worker(std::int64_t worker);

// with_machine is an alias of with_worker.
[[nodiscard]] Option with_machine(std::int64_t machine);

// with_epoch sets the absolute reference time subtracted from every timestamp.
// The zero time point is ignored. Times before the Unix epoch or after
// 9999-12-31T23:59:59.999Z are rejected; the value is checked in Unix milliseconds.
[[nodiscard]] Option with_epoch(core::Timestamp epoch);

// apply_options folds options over a default config in order.
// The first failing option aborts and its error is returned.
[[nodiscard]] core::Result<GeneratorConfig, ConfigurationError> apply_options(
    const std::vector<Option>& options);

}  // namespace flakeid::snowflake
