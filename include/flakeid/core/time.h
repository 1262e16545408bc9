#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace flakeid::core {

using Clock = std::chrono::system_clock;

// Millisecond precision keeps every four-digit-year date representable; a
// nanosecond system_clock::time_point overflows after 2262-04-11.
using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

// Last millisecond of 9999-12-31, the latest instant parse_iso8601 and
// format_iso8601 handle.
constexpr std::int64_t kMaxIso8601Millis = 253402300799999;

inline Timestamp now_utc() {
  return std::chrono::time_point_cast<std::chrono::milliseconds>(Clock::now());
}

inline std::int64_t to_unix_millis(const Timestamp ts) { return ts.time_since_epoch().count(); }

inline Timestamp from_unix_millis(const std::int64_t millis) {
  return Timestamp{std::chrono::milliseconds{millis}};
}

// is_zero reports whether ts is the default-constructed (Unix epoch) time point.
// An epoch option carrying the zero time point is treated as "not configured".
inline bool is_zero(const Timestamp ts) { return ts.time_since_epoch().count() == 0; }

// parse_iso8601 accepts "YYYY-MM-DDTHH:MM:SSZ" or a bare "YYYY-MM-DD" (midnight UTC).
// Returns nullopt for any other shape or an out-of-range field.
[[nodiscard]] std::optional<Timestamp> parse_iso8601(const std::string& text);

// format_iso8601 renders ts in UTC with millisecond precision: "YYYY-MM-DDTHH:MM:SS.mmmZ".
// Returns "" when ts lies outside [1970-01-01, 9999-12-31T23:59:59.999Z].
[[nodiscard]] std::string format_iso8601(Timestamp ts);

}  // namespace flakeid::core
