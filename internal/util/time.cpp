#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace blobkeep::util {

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

int64_t ToUnixNanos(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixNanos(int64_t ns) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(ns));
}

TimePoint ExpiryAfter(TimePoint created, int64_t ttl_seconds) {
  if (ttl_seconds > kMaxTtl.count() || ttl_seconds < -kMaxTtl.count()) {
    throw std::out_of_range("ttl of " + std::to_string(ttl_seconds) + "s exceeds " + std::to_string(kMaxTtl.count()) + "s");
  }
  return created + std::chrono::seconds(ttl_seconds);
}

std::string FormatUtc(TimePoint tp) {
  const std::time_t seconds = Clock::to_time_t(tp);
  std::tm           utc{};
  gmtime_r(&seconds, &utc);

  const auto millis = ToUnixMillis(tp) % 1000;

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << (millis < 0 ? millis + 1000 : millis) << 'Z';
  return out.str();
}

} // namespace blobkeep::util
