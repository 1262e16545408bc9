#include "flakeid/core/time.h"

#include <cstddef>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string_view>

namespace flakeid::core {

namespace {

// Parse exactly `width` decimal digits starting at `pos`.
std::optional<int> parse_digits(std::string_view text, std::size_t pos, std::size_t width) {
  if (pos + width > text.size()) {
    return std::nullopt;
  }
  int value = 0;
  for (std::size_t i = pos; i < pos + width; ++i) {
    const char c = text[i];
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    value = value * 10 + (c - '0');
  }
  return value;
}

}  // namespace

std::optional<Timestamp> parse_iso8601(const std::string& text) {
  const std::string_view view{text};
  if (view.size() != 10 && view.size() != 20) {
    return std::nullopt;
  }
  if (view[4] != '-' || view[7] != '-') {
    return std::nullopt;
  }

  const auto year = parse_digits(view, 0, 4);
  const auto month = parse_digits(view, 5, 2);
  const auto day = parse_digits(view, 8, 2);
  if (!year || !month || !day) {
    return std::nullopt;
  }

  const std::chrono::year_month_day ymd{std::chrono::year{*year},
                                        std::chrono::month{static_cast<unsigned>(*month)},
                                        std::chrono::day{static_cast<unsigned>(*day)}};
  if (!ymd.ok()) {
    return std::nullopt;
  }

  int hour = 0;
  int minute = 0;
  int second = 0;
  if (view.size() == 20) {
    if (view[10] != 'T' || view[13] != ':' || view[16] != ':' || view[19] != 'Z') {
      return std::nullopt;
    }
    const auto h = parse_digits(view, 11, 2);
    const auto m = parse_digits(view, 14, 2);
    const auto s = parse_digits(view, 17, 2);
    if (!h || !m || !s || *h > 23 || *m > 59 || *s > 59) {
      return std::nullopt;
    }
    hour = *h;
    minute = *m;
    second = *s;
  }

  const std::chrono::sys_days days{ymd};
  return Timestamp{days} + std::chrono::hours{hour} + std::chrono::minutes{minute} +
         std::chrono::seconds{second};
}

std::string format_iso8601(const Timestamp ts) {
  const auto millis = to_unix_millis(ts);
  if (millis < 0 || millis > kMaxIso8601Millis) {
    return "";
  }
  const auto time_t_value = static_cast<std::time_t>(millis / 1000);

  const std::tm* utc = std::gmtime(&time_t_value);
  if (utc == nullptr) {
    return "";
  }

  std::ostringstream oss;
  oss << std::put_time(utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis % 1000 << 'Z';
  return oss.str();
}

}  // namespace flakeid::core
