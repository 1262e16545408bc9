#include "flakeid/core/clock.h"
#include "flakeid/core/time.h"

#include <catch2/catch_test_macros.hpp>

using namespace flakeid::core;

TEST_CASE("parse_iso8601: accepted formats", "[time]") {
  SECTION("full UTC timestamp") {
    const auto ts = parse_iso8601("2019-03-07T00:00:00Z");
    REQUIRE(ts.has_value());
    CHECK(to_unix_millis(ts.value()) == 1551916800000);
  }

  SECTION("date only is midnight UTC") {
    const auto ts = parse_iso8601("2019-03-07");
    REQUIRE(ts.has_value());
    CHECK(to_unix_millis(ts.value()) == 1551916800000);
  }

  SECTION("time of day is honoured") {
    const auto ts = parse_iso8601("2023-11-14T22:13:20Z");
    REQUIRE(ts.has_value());
    CHECK(to_unix_millis(ts.value()) == 1700000000000);
  }
}

TEST_CASE("parse_iso8601: rejected formats", "[time]") {
  CHECK_FALSE(parse_iso8601("").has_value());
  CHECK_FALSE(parse_iso8601("2019-3-7").has_value());
  CHECK_FALSE(parse_iso8601("2019-02-30").has_value());
  CHECK_FALSE(parse_iso8601("2019-13-01").has_value());
  CHECK_FALSE(parse_iso8601("2019-03-07T24:00:00Z").has_value());
  CHECK_FALSE(parse_iso8601("2019-03-07T00:00:00").has_value());
  CHECK_FALSE(parse_iso8601("2019-03-07 00:00:00Z").has_value());
  CHECK_FALSE(parse_iso8601("not-a-date").has_value());
}

TEST_CASE("format_iso8601: millisecond precision in UTC", "[time]") {
  CHECK(format_iso8601(from_unix_millis(0)) == "1970-01-01T00:00:00.000Z");
  CHECK(format_iso8601(from_unix_millis(1551916800123)) == "2019-03-07T00:00:00.123Z");
}

TEST_CASE("is_zero: only the Unix epoch itself", "[time]") {
  CHECK(is_zero(Timestamp{}));
  CHECK(is_zero(from_unix_millis(0)));
  CHECK_FALSE(is_zero(from_unix_millis(1)));
}

TEST_CASE("ManualClock: set and advance", "[time][clock]") {
  ManualClock clock(1000);
  CHECK(clock.now_unix_millis() == 1000);
  clock.advance(5);
  CHECK(clock.now_unix_millis() == 1005);
  clock.set(10);
  CHECK(clock.now_unix_millis() == 10);
}

TEST_CASE("SystemClock: reports a time after 2020", "[time][clock]") {
  SystemClock clock;
  CHECK(clock.now_unix_millis() > 1577836800000);
  CHECK(system_clock().now_unix_millis() > 1577836800000);
}

TEST_CASE("parse_iso8601: dates past 2262 keep their value", "[time]") {
  const auto far = parse_iso8601("2300-01-01");
  REQUIRE(far.has_value());
  CHECK(to_unix_millis(far.value()) == 10413792000000);

  const auto last = parse_iso8601("9999-12-31T23:59:59Z");
  REQUIRE(last.has_value());
  CHECK(to_unix_millis(last.value()) == kMaxIso8601Millis - 999);
}

TEST_CASE("format_iso8601: four-digit years only", "[time]") {
  CHECK(format_iso8601(from_unix_millis(10413792000000)) == "2300-01-01T00:00:00.000Z");
  CHECK(format_iso8601(from_unix_millis(kMaxIso8601Millis)) == "9999-12-31T23:59:59.999Z");
  CHECK(format_iso8601(from_unix_millis(kMaxIso8601Millis + 1)).empty());
  CHECK(format_iso8601(from_unix_millis(-1)).empty());
}
