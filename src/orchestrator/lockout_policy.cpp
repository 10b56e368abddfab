#include "fpc/orchestrator/lockout_policy.h"

#include <string>

#include "fpc/errors.h"
#include "fpc/orchestrator/event_bus.h"

namespace fpc::orchestrator {

LockoutPolicy::LockoutPolicy(SerialQueue& queue) : LockoutPolicy(queue, Settings{}) {}

LockoutPolicy::LockoutPolicy(SerialQueue& queue, Settings settings)
    : queue_(queue), settings_(settings) {}

LockoutPolicy::~LockoutPolicy() {
  if (timer_ != 0) {
    queue_.Cancel(timer_);
  }
}

LockoutResult LockoutPolicy::RecordFailure() {
  ++failed_count_;
  if (!IsLocked()) {
    return LockoutResult::kStillOpen;
  }

  if (timer_ != 0) {
    queue_.Cancel(timer_);
  }
  locked_until_ = queue_.Now() + settings_.lockout_duration;
  timer_ = queue_.PostDelayed([this]() { OnTimerFired(); }, settings_.lockout_duration);

  Event event{};
  event.category = EventCategory::kSecurity;
  event.severity = EventSeverity::kWarning;
  event.event_id = "fingerprint_lockout_entered";
  event.message = "Too many failed fingerprint attempts";
  event.fields.emplace_back("failed_count", std::to_string(failed_count_),
                            FieldPrivacy::kPublic, true);
  event.fields.emplace_back(
      "lockout_ms",
      std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
                         settings_.lockout_duration)
                         .count()),
      FieldPrivacy::kPublic, true);
  EventBus::Instance().Publish(event);
  return LockoutResult::kLockoutEntered;
}

void LockoutPolicy::RecordSuccess() noexcept {
  failed_count_ = 0;
  locked_until_.reset();
}

void LockoutPolicy::OnTimerFired() {
  timer_ = 0;
  failed_count_ = 0;
  locked_until_.reset();

  Event event{};
  event.category = EventCategory::kSecurity;
  event.severity = EventSeverity::kInfo;
  event.event_id = "fingerprint_lockout_reset";
  event.message = std::string(errors::msg::kLockoutReset);
  EventBus::Instance().Publish(event);
}

}  // namespace fpc::orchestrator
