#include "internal/util/time.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace {

using blobkeep::util::ExpiryAfter;
using blobkeep::util::FromUnixNanos;
using blobkeep::util::kMaxTtl;
using blobkeep::util::ToUnixNanos;
using namespace std::chrono_literals;

template <typename Fn>
bool ThrowsOutOfRange(Fn fn) {
  try {
    fn();
  } catch (const std::out_of_range&) {
    return true;
  }
  return false;
}

void TestNanosKeepClockPrecision() {
  const auto now = blobkeep::util::Now() + 123us + 7ns;
  assert(FromUnixNanos(ToUnixNanos(now)) == now);

  assert(ToUnixNanos(FromUnixNanos(1'700'000'000'123'456'789)) == 1'700'000'000'123'456'789);
  assert(ToUnixNanos(FromUnixNanos(-1)) == -1);
}

void TestFormatUtc() {
  assert(blobkeep::util::FormatUtc(blobkeep::util::FromUnixMillis(1'700'000'000'123)) == "2023-11-14T22:13:20.123Z");
  assert(blobkeep::util::FormatUtc(blobkeep::util::FromUnixMillis(0)) == "1970-01-01T00:00:00.000Z");
}

void TestExpiryAfterAddsSeconds() {
  const auto created = blobkeep::util::Now();
  assert(ExpiryAfter(created, 0) == created);
  assert(ExpiryAfter(created, 86'400) == created + 24h);
  assert(ExpiryAfter(created, -5) == created - 5s);
  assert(ExpiryAfter(created, kMaxTtl.count()) == created + kMaxTtl);
}

void TestExpiryAfterRejectsHugeTtl() {
  const auto created = blobkeep::util::Now();
  assert(ThrowsOutOfRange([&] { (void)ExpiryAfter(created, kMaxTtl.count() + 1); }));
  assert(ThrowsOutOfRange([&] { (void)ExpiryAfter(created, -kMaxTtl.count() - 1); }));
  assert(ThrowsOutOfRange([&] { (void)ExpiryAfter(created, std::numeric_limits<int64_t>::max()); }));
  assert(ThrowsOutOfRange([&] { (void)ExpiryAfter(created, std::numeric_limits<int64_t>::min()); }));
}

} // namespace

int main() {
  TestNanosKeepClockPrecision();
  TestFormatUtc();
  TestExpiryAfterAddsSeconds();
  TestExpiryAfterRejectsHugeTtl();

  std::cout << "blobkeep_unit_time: pass\n";
  return 0;
}
