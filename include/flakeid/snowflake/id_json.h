#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>

namespace flakeid::snowflake {

// id_to_json renders the decoded fields of id.
// epoch_offset_millis must be the offset of the generator that issued id; it is added back
// to produce "unix_millis" and "time".
//
// Shape:
//   {"id": "<decimal>", "timestamp_delta": n, "unix_millis": n, "time": "<ISO-8601>",
//    "data_center": n, "worker": n, "sequence": n}
//
// "id" is a string so that JSON consumers with 53-bit numbers keep every digit.
// "unix_millis" and "time" are null when the offset is negative or the sum falls
// after 9999-12-31T23:59:59.999Z.
[[nodiscard]] nlohmann::json id_to_json(std::int64_t id, std::int64_t epoch_offset_millis);

}  // namespace flakeid::snowflake
