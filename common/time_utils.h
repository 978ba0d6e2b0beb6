#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <ctime>

namespace Common {

/// Nanoseconds from CLOCK_MONOTONIC
inline auto getNanosSinceEpoch() noexcept -> uint64_t {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL + static_cast<uint64_t>(ts.tv_nsec);
}

/// Nanoseconds from CLOCK_REALTIME for wall clock stamps
inline auto getWallClockNanos() noexcept -> uint64_t {
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL + static_cast<uint64_t>(ts.tv_nsec);
}

/// Formats the current UTC time as ISO 8601 ("2024-01-31T12:00:00Z")
/// Returns the number of characters written, 0 on failure
inline auto formatUtcTimestamp(char* buffer, size_t size) noexcept -> size_t {
  if (buffer == nullptr || size == 0) return 0;
  const time_t now = static_cast<time_t>(getWallClockNanos() / 1'000'000'000ULL);
  struct tm utc{};
  if (gmtime_r(&now, &utc) == nullptr) {
    buffer[0] = '\0';
    return 0;
  }
  return strftime(buffer, size, "%Y-%m-%dT%H:%M:%SZ", &utc);
}

/// Milliseconds elapsed since a getNanosSinceEpoch() mark
inline auto elapsedMillis(uint64_t start_nanos) noexcept -> double {
  return static_cast<double>(getNanosSinceEpoch() - start_nanos) / 1'000'000.0;
}

} // namespace Common
