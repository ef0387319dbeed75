#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace blobkeep::core {

/*
  Background worker that periodically removes expired items.

  Every interval it invokes the sweep callback. A sweep that throws is
  logged and retried on the next tick; the worker keeps running.

  Shutdown handshake:
      Stop() sets the stop flag, wakes the worker and joins it.
      When Stop() returns the worker thread has exited and no further
      sweep will start.
*/
class ExpiryReaper {
 public:
  // Returns the number of items removed.
  using SweepFn = std::function<std::size_t()>;

  static constexpr std::chrono::milliseconds kDefaultInterval = std::chrono::minutes(1);

  ExpiryReaper(SweepFn sweep, std::chrono::milliseconds interval = kDefaultInterval);
  ~ExpiryReaper();

  ExpiryReaper(const ExpiryReaper&)            = delete;
  ExpiryReaper& operator=(const ExpiryReaper&) = delete;

  void Start();
  void Stop();

  bool IsRunning() const;

  // Sweeps attempted so far, failed ones included.
  uint64_t SweepCount() const;

 private:
  void Run();

  SweepFn                   sweep_;
  std::chrono::milliseconds interval_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  bool                    stop_requested_ = false;
  bool                    running_        = false;
  uint64_t                sweeps_         = 0;

  std::thread thread_;
};

} // namespace blobkeep::core
