#pragma once

#include <atomic>

namespace dl100_bridge::core {

// Publish on/off switch. Read by the worker before every send, written by the
// control context. Never touches aggregation state.
class ActivationGate {
 public:
  explicit ActivationGate(bool initially_active = true) noexcept : active_(initially_active) {}

  ActivationGate(const ActivationGate&) = delete;
  ActivationGate& operator=(const ActivationGate&) = delete;

  // Flips the flag and returns the new state.
  bool toggle() noexcept {
    bool expected = active_.load(std::memory_order_relaxed);
    while (!active_.compare_exchange_weak(expected, !expected, std::memory_order_acq_rel,
                                          std::memory_order_relaxed)) {
    }
    return !expected;
  }

  [[nodiscard]] bool is_active() const noexcept { return active_.load(std::memory_order_acquire); }

  void set_active(const bool active) noexcept { active_.store(active, std::memory_order_release); }

 private:
  std::atomic<bool> active_;
};

}  // namespace dl100_bridge::core
