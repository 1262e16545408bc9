#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace flakeid::cli {

// NextCliConfig holds the flags of `flakeid_cli next`.
// Numeric flags are kept as raw text and checked by validate_next_config, so a
// malformed value is reported once with the flag name instead of silently defaulting.
struct NextCliConfig {
  std::optional<std::string> data_center;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> worker;       // NOLINT(readability-identifier-naming)
  std::optional<std::string> epoch;        // NOLINT(readability-identifier-naming)
  std::string count{"1"};                  // NOLINT(readability-identifier-naming)
  bool json{false};                        // NOLINT(readability-identifier-naming)
};

// DecodeCliConfig holds the positional id and flags of `flakeid_cli decode`.
struct DecodeCliConfig {
  std::optional<std::string> id;     // NOLINT(readability-identifier-naming)
  std::optional<std::string> epoch;  // NOLINT(readability-identifier-naming)
};

// Upper bound for --count; keeps a typo from spinning out millions of ids.
constexpr std::int64_t kMaxCount = 1000000;

// parse_int64 accepts an optional leading '-' followed by decimal digits only.
[[nodiscard]] std::optional<std::int64_t> parse_int64(const std::string& text);

// validate_next_config checks flag syntax for `next`.
// Returns "" on success, or an error message naming the offending flag.
// Range checks on --data-center/--worker are left to Generator::create.
[[nodiscard]] std::string validate_next_config(const NextCliConfig& config);

// validate_decode_config checks that the id is a non-negative integer and the epoch parses.
// Returns "" on success, or an error message.
[[nodiscard]] std::string validate_decode_config(const DecodeCliConfig& config);

}  // namespace flakeid::cli
