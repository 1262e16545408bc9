#pragma once

#include "flakeid/core/clock.h"
#include "flakeid/core/result.h"
#include "flakeid/snowflake/generator.h"
#include "flakeid/snowflake/options.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace flakeid::snowflake {

// GeneratorRegistry is a one-time lazy cell holding a single Generator.
//
// First caller wins: whichever of init() or instance() runs first decides the configuration.
// A failed init() leaves the cell empty so the caller can fix the options and retry.
// Once the generator exists, init() has no effect and returns ok(false).
//
// Thread-safety: every access takes the registry mutex, so concurrent first callers block
// until the winner has finished constructing, then observe the same instance.
class GeneratorRegistry {
 public:
  explicit GeneratorRegistry(core::IClock& clock = core::system_clock()) : clock_(clock) {}
  ~GeneratorRegistry() = default;

  GeneratorRegistry(const GeneratorRegistry&) = delete;
  GeneratorRegistry& operator=(const GeneratorRegistry&) = delete;
  GeneratorRegistry(GeneratorRegistry&&) = delete;
  GeneratorRegistry& operator=(GeneratorRegistry&&) = delete;

  // Returns ok(true) when this call created the generator, ok(false) when it already existed.
  [[nodiscard]] core::Result<bool, ConfigurationError> init(const std::vector<Option>& options);

  // Returns the generator, creating it with default options on first use.
  [[nodiscard]] Generator& instance();

  [[nodiscard]] bool initialized() const;

 private:
  core::IClock& clock_;
  mutable std::mutex mutex_;
  std::unique_ptr<Generator> generator_;  // guarded by mutex_
};

// default_registry returns the process-wide registry bound to the system clock.
GeneratorRegistry& default_registry();

// Process-scope convenience, delegating to default_registry().
// init must run before the first next()/next_string() to take effect.
[[nodiscard]] core::Result<bool, ConfigurationError> init(const std::vector<Option>& options);
[[nodiscard]] std::int64_t next();
[[nodiscard]] std::string next_string();

}  // namespace flakeid::snowflake
