#include "config.h"

#include "flakeid/core/time.h"

#include <cstddef>
#include <limits>
#include <string>

namespace flakeid::cli {

std::optional<std::int64_t> parse_int64(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }

  const bool negative = text[0] == '-';
  const std::size_t start = negative ? 1 : 0;
  if (start == text.size()) {
    return std::nullopt;
  }

  // Accumulate as a negative number so INT64_MIN parses without overflow.
  std::int64_t value = 0;
  for (std::size_t i = start; i < text.size(); ++i) {
    const char c = text[i];
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    const int digit = c - '0';
    if (value < (std::numeric_limits<std::int64_t>::min() + digit) / 10) {
      return std::nullopt;
    }
    value = value * 10 - digit;
  }

  if (negative) {
    return value;
  }
  if (value == std::numeric_limits<std::int64_t>::min()) {
    return std::nullopt;
  }
  return -value;
}

std::string validate_next_config(const NextCliConfig& config) {
  if (config.data_center.has_value() && !parse_int64(config.data_center.value()).has_value()) {
    return "Error: --data-center must be an integer, got '" + config.data_center.value() + "'";
  }
  if (config.worker.has_value() && !parse_int64(config.worker.value()).has_value()) {
    return "Error: --worker must be an integer, got '" + config.worker.value() + "'";
  }
  if (config.epoch.has_value() && !core::parse_iso8601(config.epoch.value()).has_value()) {
    return "Error: --epoch must be YYYY-MM-DD or YYYY-MM-DDTHH:MM:SSZ, got '" +
           config.epoch.value() + "'";
  }

  const auto count = parse_int64(config.count);
  if (!count.has_value() || count.value() < 1 || count.value() > kMaxCount) {
    return "Error: --count must be an integer in [1, " + std::to_string(kMaxCount) + "], got '" +
           config.count + "'";
  }
  return "";
}

std::string validate_decode_config(const DecodeCliConfig& config) {
  if (!config.id.has_value()) {
    return "Error: an id to decode is required";
  }
  const auto id = parse_int64(config.id.value());
  if (!id.has_value() || id.value() < 0) {
    return "Error: id must be a non-negative decimal integer, got '" + config.id.value() + "'";
  }
  if (config.epoch.has_value()) {
    const auto epoch = core::parse_iso8601(config.epoch.value());
    if (!epoch.has_value()) {
      return "Error: --epoch must be YYYY-MM-DD or YYYY-MM-DDTHH:MM:SSZ, got '" +
             config.epoch.value() + "'";
    }
    if (core::to_unix_millis(epoch.value()) < 0) {
      return "Error: --epoch must not be before 1970-01-01, got '" + config.epoch.value() + "'";
    }
  }
  return "";
}

}  // namespace flakeid::cli
