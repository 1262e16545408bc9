#include "flakeid/snowflake/default_generator.h"

#include <memory>
#include <utility>

namespace flakeid::snowflake {

core::Result<bool, ConfigurationError> GeneratorRegistry::init(
    const std::vector<Option>& options) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (generator_) {
    return core::Result<bool, ConfigurationError>::ok(false);
  }

  auto created = Generator::create(options, clock_);
  if (!created.has_value()) {
    return core::Result<bool, ConfigurationError>::err(created.error());
  }
  generator_ = std::move(created.value());
  return core::Result<bool, ConfigurationError>::ok(true);
}

Generator& GeneratorRegistry::instance() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!generator_) {
    generator_ = std::make_unique<Generator>(GeneratorConfig{}, clock_);
  }
  return *generator_;
}

bool GeneratorRegistry::initialized() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return generator_ != nullptr;
}

GeneratorRegistry& default_registry() {
  static GeneratorRegistry registry;
  return registry;
}

core::Result<bool, ConfigurationError> init(const std::vector<Option>& options) {
  return default_registry().init(options);
}

std::int64_t next() { return default_registry().instance().next(); }

std::string next_string() { return default_registry().instance().next_string(); }

}  // namespace flakeid::snowflake
