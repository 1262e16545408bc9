#include "flakeid/snowflake/options.h"

#include "flakeid/snowflake/layout.h"

namespace flakeid::snowflake {

namespace {

OptionResult check_range(const std::string& field, const std::int64_t value,
                         const std::int64_t max) {
  if (value < 0 || value > max) {
    return OptionResult::err(ConfigurationError{field, value, 0, max});
  }
  return OptionResult::ok(true);
}

}  // namespace

std::string ConfigurationError::message() const {
  return field + " must be in [" + std::to_string(min) + ", " + std::to_string(max) + "], got " +
         std::to_string(value);
}

std::int64_t GeneratorConfig::epoch_offset_millis() const {
  if (!epoch.has_value()) {
    return 0;
  }
  return core::to_unix_millis(epoch.value());
}

bool GeneratorConfig::uses_default_identity() const { return data_center == 0 && worker == 0; }

Option with_data_center(const std::int64_t data_center) {
  return [data_center](GeneratorConfig& config) {
    auto checked = check_range("data_center", data_center, kMaxDataCenter);
    if (checked.has_value()) {
      config.data_center = data_center;
    }
    return checked;
  };
}

Option with_worker(const std::int64_t worker) {
  return [worker](GeneratorConfig& config) {
    auto checked = check_range("worker", worker, kMaxWorker);
    if (checked.has_value()) {
      config.worker = worker;
    }
    return checked;
  };
}

Option with_machine(const std::int64_t machine) { return with_worker(machine); }

Option with_epoch(const core::Timestamp epoch) {
  return [epoch](GeneratorConfig& config) {
    if (core::is_zero(epoch)) {
      return OptionResult::ok(true);
    }
    const auto millis = core::to_unix_millis(epoch);
    if (millis < 0 || millis > core::kMaxIso8601Millis) {
      return OptionResult::err(ConfigurationError{"epoch", millis, 0, core::kMaxIso8601Millis});
    }
    config.epoch = epoch;
    return OptionResult::ok(true);
  };
}

core::Result<GeneratorConfig, ConfigurationError> apply_options(
    const std::vector<Option>& options) {
  GeneratorConfig config;
  for (const auto& option : options) {
    auto applied = option(config);
    if (!applied.has_value()) {
      return core::Result<GeneratorConfig, ConfigurationError>::err(applied.error());
    }
  }
  return core::Result<GeneratorConfig, ConfigurationError>::ok(std::move(config));
}

}  // namespace flakeid::snowflake
