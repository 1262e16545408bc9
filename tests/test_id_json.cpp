#include "flakeid/snowflake/id_json.h"
#include "flakeid/snowflake/layout.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>

using namespace flakeid::snowflake;

TEST_CASE("id_to_json: renders every field", "[json]") {
  constexpr std::int64_t epoch = 1551916800000;  // 2019-03-07T00:00:00Z
  const auto id = compose(IdParts{1500, 3, 7, 42});

  const auto out = id_to_json(id, epoch);
  CHECK(out["id"] == std::to_string(id));
  CHECK(out["timestamp_delta"] == 1500);
  CHECK(out["unix_millis"] == epoch + 1500);
  CHECK(out["time"] == "2019-03-07T00:00:01.500Z");
  CHECK(out["data_center"] == 3);
  CHECK(out["worker"] == 7);
  CHECK(out["sequence"] == 42);
}

TEST_CASE("id_to_json: id is a string to survive 53-bit JSON readers", "[json]") {
  const auto id = compose(IdParts{kMaxTimestamp, 0, 0, 1});
  const auto out = id_to_json(id, 0);
  REQUIRE(out["id"].is_string());
  CHECK(out["id"].get<std::string>() == std::to_string(id));
}

TEST_CASE("id_to_json: far-future epochs render without overflow", "[json]") {
  constexpr std::int64_t epoch = 7258118400000;  // 2200-01-01T00:00:00Z
  const auto out = id_to_json(INT64_MAX, epoch);
  CHECK(out["timestamp_delta"] == kMaxTimestamp);
  CHECK(out["unix_millis"] == epoch + kMaxTimestamp);
  CHECK(out["time"] == "2269-09-07T15:47:35.551Z");
}

TEST_CASE("id_to_json: unrenderable wall-clock time is null", "[json]") {
  const auto id = compose(IdParts{10, 0, 0, 0});

  const auto negative = id_to_json(id, -5000);
  CHECK(negative["unix_millis"].is_null());
  CHECK(negative["time"].is_null());

  const auto huge = id_to_json(id, INT64_MAX);
  CHECK(huge["unix_millis"].is_null());
  CHECK(huge["time"].is_null());
  CHECK(huge["timestamp_delta"] == 10);
}
