#include "next_logic.h"

#include "flakeid/core/time.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

int execute_next(flakeid::snowflake::Generator& generator, const std::int64_t count,
                 const bool as_json, std::ostream& out, std::ostream& err) {
  std::vector<std::int64_t> ids;
  ids.reserve(static_cast<std::size_t>(count));

  for (std::int64_t i = 0; i < count; ++i) {
    const auto result = generator.try_next();
    if (!result.has_value()) {
      err << "Error: " << flakeid::snowflake::to_string(result.error()) << " after " << i
          << " id(s); retry once the clock has caught up\n";
      return 1;
    }
    ids.push_back(result.value());
  }

  if (!as_json) {
    for (const auto id : ids) {
      out << id << "\n";
    }
    return 0;
  }

  const auto& config = generator.config();
  nlohmann::json doc;
  doc["data_center"] = config.data_center;
  doc["worker"] = config.worker;
  doc["epoch_offset_millis"] = generator.epoch_offset_millis();
  if (config.epoch.has_value()) {
    doc["epoch"] = flakeid::core::format_iso8601(config.epoch.value());
  } else {
    doc["epoch"] = nullptr;
  }
  doc["ids"] = nlohmann::json::array();
  for (const auto id : ids) {
    doc["ids"].push_back(std::to_string(id));
  }

  out << doc.dump(2) << "\n";
  return 0;
}
