#include "expiry_reaper.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace blobkeep::core {

using blobkeep::observability::IntField;
using blobkeep::observability::StringField;

ExpiryReaper::ExpiryReaper(SweepFn sweep, std::chrono::milliseconds interval) : sweep_(std::move(sweep)), interval_(interval) {
  if (!sweep_) {
    throw std::invalid_argument("expiry reaper requires a sweep function");
  }
  if (interval_ <= std::chrono::milliseconds::zero()) {
    throw std::invalid_argument("expiry reaper interval must be positive");
  }
}

ExpiryReaper::~ExpiryReaper() {
  Stop();
}

void ExpiryReaper::Start() {
  std::lock_guard lock(mutex_);
  if (running_) {
    return;
  }

  stop_requested_ = false;
  running_        = true;
  thread_         = std::thread(&ExpiryReaper::Run, this);
}

void ExpiryReaper::Stop() {
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = true;
  }
  cv_.notify_all();

  // join is the acknowledgment: Run() has returned
  if (thread_.joinable()) {
    thread_.join();
  }

  std::lock_guard lock(mutex_);
  running_ = false;
}

bool ExpiryReaper::IsRunning() const {
  std::lock_guard lock(mutex_);
  return running_;
}

uint64_t ExpiryReaper::SweepCount() const {
  std::lock_guard lock(mutex_);
  return sweeps_;
}

void ExpiryReaper::Run() {
  std::unique_lock lock(mutex_);

  while (true) {
    if (cv_.wait_for(lock, interval_, [&] { return stop_requested_; })) {
      break;
    }

    ++sweeps_;
    lock.unlock();

    try {
      const auto removed = sweep_();
      if (removed > 0) {
        BLOBKEEP_LOG_INFO("Deleted expired Items", {IntField("count", static_cast<int64_t>(removed))});
      }
    } catch (const std::exception& e) {
      BLOBKEEP_LOG_ERROR("Deletion of expired Items failed", {StringField("error", e.what())});
    }

    lock.lock();
  }
}

} // namespace blobkeep::core
