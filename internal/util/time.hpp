#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace blobkeep::util {

/*
  Time utilities. All expiry math goes through Now().

  Timestamps are persisted as unix epoch nanoseconds, which keeps a
  stored Item identical to the one written.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

int64_t   ToUnixNanos(TimePoint tp);
TimePoint FromUnixNanos(int64_t ns);

// Longest accepted time-to-live. Keeps expiry arithmetic well inside
// the nanosecond range of TimePoint.
inline constexpr std::chrono::seconds kMaxTtl = std::chrono::hours(24 * 365 * 100);

// created + ttl_seconds. Throws std::out_of_range beyond +/- kMaxTtl.
TimePoint ExpiryAfter(TimePoint created, int64_t ttl_seconds);

// ISO-8601 UTC rendering, used by the CLI.
std::string FormatUtc(TimePoint tp);

} // namespace blobkeep::util
