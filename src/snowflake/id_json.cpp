#include "flakeid/snowflake/id_json.h"

#include "flakeid/core/time.h"
#include "flakeid/snowflake/layout.h"

#include <string>

namespace flakeid::snowflake {

nlohmann::json id_to_json(const std::int64_t id, const std::int64_t epoch_offset_millis) {
  const auto parts = decompose(id);

  nlohmann::json out;
  out["id"] = std::to_string(id);
  out["timestamp_delta"] = parts.timestamp_delta;

  // Only render wall-clock fields when delta + offset is a formattable instant;
  // the bound check also keeps the addition itself from overflowing.
  if (epoch_offset_millis >= 0 && epoch_offset_millis <= core::kMaxIso8601Millis &&
      parts.timestamp_delta >= 0 &&
      parts.timestamp_delta <= core::kMaxIso8601Millis - epoch_offset_millis) {
    const auto unix_millis = unix_millis_of(id, epoch_offset_millis);
    out["unix_millis"] = unix_millis;
    out["time"] = core::format_iso8601(core::from_unix_millis(unix_millis));
  } else {
    out["unix_millis"] = nullptr;
    out["time"] = nullptr;
  }
  out["data_center"] = parts.data_center;
  out["worker"] = parts.worker;
  out["sequence"] = parts.sequence;
  return out;
}

}  // namespace flakeid::snowflake
