#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

#include "fpc/orchestrator/serial_queue.h"

namespace fpc::orchestrator {

enum class LockoutResult { kStillOpen, kLockoutEntered };

// Consecutive authentication failures and the self-resetting lockout timer. All calls,
// including the timer firing, run on the serial queue.
class LockoutPolicy {
public:
  struct Settings {
    std::uint32_t max_failed_attempts{5};
    std::chrono::milliseconds lockout_duration{std::chrono::seconds(30)};
  };

  explicit LockoutPolicy(SerialQueue& queue);
  LockoutPolicy(SerialQueue& queue, Settings settings);
  ~LockoutPolicy();

  LockoutPolicy(const LockoutPolicy&) = delete;
  LockoutPolicy& operator=(const LockoutPolicy&) = delete;

  // Past the threshold every failure re-arms the timer and pushes locked_until forward.
  LockoutResult RecordFailure();
  // Leaves a pending timer in place; its firing is a harmless reset.
  void RecordSuccess() noexcept;

  [[nodiscard]] bool IsLocked() const noexcept {
    return failed_count_ > settings_.max_failed_attempts;
  }
  [[nodiscard]] std::uint32_t failed_count() const noexcept { return failed_count_; }
  [[nodiscard]] std::optional<SerialQueue::TimePoint> locked_until() const noexcept {
    return locked_until_;
  }
  [[nodiscard]] const Settings& settings() const noexcept { return settings_; }

private:
  void OnTimerFired();

  SerialQueue& queue_;
  Settings settings_;
  std::uint32_t failed_count_{0};
  std::optional<SerialQueue::TimePoint> locked_until_;
  SerialQueue::TaskId timer_{0};
};

}  // namespace fpc::orchestrator
