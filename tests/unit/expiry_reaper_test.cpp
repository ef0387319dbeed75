#include "internal/core/expiry_reaper.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace {

using blobkeep::core::ExpiryReaper;
using namespace std::chrono_literals;

bool WaitUntil(const std::function<bool()>& condition, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(5ms);
  }
  return condition();
}

void TestSweepsRunOnEveryInterval() {
  std::atomic<int> calls{0};
  ExpiryReaper     reaper([&] { return static_cast<std::size_t>(++calls); }, 20ms);

  assert(!reaper.IsRunning());
  reaper.Start();
  assert(reaper.IsRunning());

  assert(WaitUntil([&] { return calls.load() >= 3; }, 2s));
  reaper.Stop();

  assert(!reaper.IsRunning());
  assert(reaper.SweepCount() == static_cast<uint64_t>(calls.load()));
}

void TestNoSweepBeforeFirstInterval() {
  std::atomic<int> calls{0};
  ExpiryReaper     reaper([&] { return static_cast<std::size_t>(++calls); }, 10s);

  reaper.Start();
  std::this_thread::sleep_for(50ms);
  reaper.Stop();

  assert(calls.load() == 0);
}

void TestFailingSweepKeepsWorkerAlive() {
  std::atomic<int> calls{0};
  ExpiryReaper     reaper(
      [&]() -> std::size_t {
        ++calls;
        throw std::runtime_error("database is locked");
      },
      10ms);

  reaper.Start();
  assert(WaitUntil([&] { return calls.load() >= 3; }, 2s));
  assert(reaper.IsRunning());
  reaper.Stop();
}

void TestStopWaitsForSweepInFlight() {
  std::atomic<bool> in_sweep{false};
  std::atomic<bool> finished{false};
  ExpiryReaper      reaper(
      [&]() -> std::size_t {
        in_sweep = true;
        std::this_thread::sleep_for(100ms);
        finished = true;
        return 0;
      },
      5ms);

  reaper.Start();
  assert(WaitUntil([&] { return in_sweep.load(); }, 2s));

  reaper.Stop();
  assert(finished.load() && "Stop must not return while a sweep is running");
}

void TestNoSweepAfterStop() {
  std::atomic<int> calls{0};
  ExpiryReaper     reaper([&] { return static_cast<std::size_t>(++calls); }, 5ms);

  reaper.Start();
  assert(WaitUntil([&] { return calls.load() >= 1; }, 2s));
  reaper.Stop();

  const int after_stop = calls.load();
  std::this_thread::sleep_for(50ms);
  assert(calls.load() == after_stop);

  // second Stop is a no-op
  reaper.Stop();
}

void TestStopWakesLongWait() {
  ExpiryReaper reaper([] { return std::size_t{0}; }, 1h);
  reaper.Start();

  const auto start = std::chrono::steady_clock::now();
  reaper.Stop();
  assert(std::chrono::steady_clock::now() - start < 5s);
}

void TestInvalidArgumentsAreRejected() {
  bool threw = false;
  try {
    ExpiryReaper reaper(nullptr, 1s);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    ExpiryReaper reaper([] { return std::size_t{0}; }, 0ms);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSweepsRunOnEveryInterval();
  TestNoSweepBeforeFirstInterval();
  TestFailingSweepKeepsWorkerAlive();
  TestStopWaitsForSweepInFlight();
  TestNoSweepAfterStop();
  TestStopWakesLongWait();
  TestInvalidArgumentsAreRejected();

  std::cout << "blobkeep_unit_expiry_reaper: pass\n";
  return 0;
}
