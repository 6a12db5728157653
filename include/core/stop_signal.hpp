#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace dl100_bridge::core {

// Cancellation channel shared between a worker and its owner.
class StopSignal {
 public:
  StopSignal() = default;

  StopSignal(const StopSignal&) = delete;
  StopSignal& operator=(const StopSignal&) = delete;

  void request() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      requested_ = true;
    }
    cv_.notify_all();
  }

  void reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    requested_ = false;
  }

  [[nodiscard]] bool requested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requested_;
  }

  // Sleeps up to `timeout`; returns true as soon as a stop is requested.
  template <typename Rep, typename Period>
  bool wait_for(const std::chrono::duration<Rep, Period>& timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (timeout <= std::chrono::duration<Rep, Period>::zero()) {
      return requested_;
    }
    return cv_.wait_for(lock, timeout, [this]() { return requested_; });
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool requested_{false};
};

}  // namespace dl100_bridge::core
