#pragma once

#include <cstdint>

namespace flakeid::snowflake {

// Bit layout of a generated identifier, most significant field first:
//
//   | sign (0) | timestamp delta (41) | data center (5) | worker (5) | sequence (12) |
//
// The timestamp delta counts milliseconds since the generator's epoch offset.
// Encoder and decoder share these constants; identifiers produced under a different
// layout decode to garbage.
constexpr int kSequenceBits = 12;
constexpr int kWorkerBits = 5;
constexpr int kDataCenterBits = 5;
constexpr int kTimestampBits = 41;

static_assert(kTimestampBits + kDataCenterBits + kWorkerBits + kSequenceBits <= 63,
              "identifier fields must leave the sign bit clear");

constexpr std::int64_t kMaxSequence = (std::int64_t{1} << kSequenceBits) - 1;
constexpr std::int64_t kMaxWorker = (std::int64_t{1} << kWorkerBits) - 1;
constexpr std::int64_t kMaxDataCenter = (std::int64_t{1} << kDataCenterBits) - 1;
constexpr std::int64_t kMaxTimestamp = (std::int64_t{1} << kTimestampBits) - 1;

constexpr int kWorkerShift = kSequenceBits;
constexpr int kDataCenterShift = kWorkerBits + kSequenceBits;
constexpr int kTimeShift = kDataCenterBits + kWorkerBits + kSequenceBits;

constexpr std::int64_t kWorkerMask = kMaxWorker << kWorkerShift;
constexpr std::int64_t kDataCenterMask = kMaxDataCenter << kDataCenterShift;

// Returned by Generator::next() when no identifier could be issued.
// Never a valid identifier: valid ones are non-negative.
constexpr std::int64_t kInvalidId = -1;

// IdParts is the decoded form of an identifier.
struct IdParts {
  std::int64_t timestamp_delta{0};  // NOLINT(readability-identifier-naming)
  std::int64_t data_center{0};      // NOLINT(readability-identifier-naming)
  std::int64_t worker{0};           // NOLINT(readability-identifier-naming)
  std::int64_t sequence{0};         // NOLINT(readability-identifier-naming)

  bool operator==(const IdParts&) const = default;
};

// compose packs parts into an identifier. Fields are not range-checked here;
// callers (Generator) guarantee every field fits its width.
constexpr std::int64_t compose(const IdParts& parts) {
  return (parts.timestamp_delta << kTimeShift) | (parts.data_center << kDataCenterShift) |
         (parts.worker << kWorkerShift) | parts.sequence;
}

// time_of returns the millisecond delta from the generating epoch offset.
// Add the offset back (unix_millis_of) to recover wall-clock time.
constexpr std::int64_t time_of(const std::int64_t id) { return id >> kTimeShift; }

constexpr std::int64_t data_center_of(const std::int64_t id) {
  return (id & kDataCenterMask) >> kDataCenterShift;
}

constexpr std::int64_t worker_of(const std::int64_t id) {
  return (id & kWorkerMask) >> kWorkerShift;
}

// machine_of is the historical name for the worker field.
constexpr std::int64_t machine_of(const std::int64_t id) { return worker_of(id); }

constexpr std::int64_t sequence_of(const std::int64_t id) { return id & kMaxSequence; }

constexpr IdParts decompose(const std::int64_t id) {
  return IdParts{time_of(id), data_center_of(id), worker_of(id), sequence_of(id)};
}

constexpr std::int64_t unix_millis_of(const std::int64_t id,
                                      const std::int64_t epoch_offset_millis) {
  return time_of(id) + epoch_offset_millis;
}

}  // namespace flakeid::snowflake
