#include "fpc/orchestrator/event_dispatcher.h"

#include <exception>
#include <sstream>
#include <string>
#include <utility>

#include "fpc/error.h"
#include "fpc/errors.h"
#include "fpc/orchestrator/event_bus.h"

namespace fpc::orchestrator {

namespace {

void PublishDispatchWarning(std::string event_id, std::string message,
                            std::vector<EventField> fields = {}) {
  Event event{};
  event.category = EventCategory::kDiagnostics;
  event.severity = EventSeverity::kWarning;
  event.event_id = std::move(event_id);
  event.message = std::move(message);
  event.fields = std::move(fields);
  EventBus::Instance().Publish(event);
}

template <class T>
std::string JoinIds(const std::vector<T>& values) {
  std::ostringstream oss;
  oss << '[';
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i != 0) {
      oss << ',';
    }
    oss << values[i];
  }
  oss << ']';
  return oss.str();
}

}  // namespace

EventDispatcher::EventDispatcher(SerialQueue& queue, SessionCoordinator& coordinator,
                                 LockoutPolicy& lockout, DriverConnection& driver,
                                 std::shared_ptr<TemplateStore> templates,
                                 std::shared_ptr<FeedbackSink> feedback)
    : queue_(queue),
      coordinator_(coordinator),
      lockout_(lockout),
      driver_(driver),
      templates_(std::move(templates)),
      feedback_(std::move(feedback)) {}

template <class Fn>
void EventDispatcher::PostIfAttached(Fn&& fn) {
  if (detached_.load(std::memory_order_acquire)) {
    return;
  }
  queue_.Post(std::forward<Fn>(fn));
}

void EventDispatcher::OnEnrollResult(std::uint64_t device_id, std::uint32_t template_id,
                                     std::int32_t subject, std::int32_t remaining) {
  PostIfAttached([this, device_id, template_id, subject, remaining]() {
    DispatchEnrollResult(device_id, template_id, subject, remaining);
  });
}

void EventDispatcher::OnAcquired(std::uint64_t device_id, std::int32_t acquired_info) {
  PostIfAttached(
      [this, device_id, acquired_info]() { DispatchAcquired(device_id, acquired_info); });
}

void EventDispatcher::OnAuthenticated(std::uint64_t device_id, std::uint32_t template_id,
                                      std::int32_t subject) {
  PostIfAttached([this, device_id, template_id, subject]() {
    DispatchAuthenticated(device_id, template_id, subject);
  });
}

void EventDispatcher::OnError(std::uint64_t device_id, std::int32_t error) {
  PostIfAttached([this, device_id, error]() { DispatchError(device_id, error); });
}

void EventDispatcher::OnRemoved(std::uint64_t device_id, std::uint32_t template_id,
                                std::int32_t subject) {
  PostIfAttached([this, device_id, template_id, subject]() {
    DispatchRemoved(device_id, template_id, subject);
  });
}

void EventDispatcher::OnEnumerate(std::uint64_t device_id,
                                  std::vector<std::uint32_t> template_ids,
                                  std::vector<std::int32_t> subjects) {
  PostIfAttached([this, device_id, ids = std::move(template_ids),
                  subs = std::move(subjects)]() { DispatchEnumerate(device_id, ids, subs); });
}

void EventDispatcher::CheckDevice(std::uint64_t device_id, const char* event) const {
  const auto expected = driver_.device_id();
  if (expected == 0 || device_id == expected) {
    return;
  }
  // Single sensor: still routed, only noted.
  PublishDispatchWarning("driver_device_mismatch", "Driver event from unexpected device",
                         {EventField{"event", event},
                          EventField{"device_id", std::to_string(device_id), FieldPrivacy::kHash},
                          EventField{"expected", std::to_string(expected), FieldPrivacy::kHash}});
}

void EventDispatcher::AddTemplate(std::int32_t subject, std::uint32_t template_id) {
  if (!templates_) {
    return;
  }
  try {
    templates_->Add(subject, template_id);
  } catch (const std::exception& ex) {
    PublishDispatchWarning("template_add_failed", ex.what(),
                           {EventField{"subject", std::to_string(subject), FieldPrivacy::kHash},
                            EventField{"template_id", std::to_string(template_id),
                                       FieldPrivacy::kPublic, true}});
  }
}

void EventDispatcher::RemoveTemplate(std::int32_t subject, std::uint32_t template_id) {
  if (!templates_) {
    return;
  }
  try {
    templates_->Remove(subject, template_id);
  } catch (const std::exception& ex) {
    PublishDispatchWarning("template_remove_failed", ex.what(),
                           {EventField{"subject", std::to_string(subject), FieldPrivacy::kHash},
                            EventField{"template_id", std::to_string(template_id),
                                       FieldPrivacy::kPublic, true}});
  }
}

void EventDispatcher::FeedbackSuccess() {
  if (!feedback_) {
    return;
  }
  try {
    feedback_->Success();
  } catch (const std::exception& ex) {
    PublishDispatchWarning("feedback_failed", ex.what());
  }
}

void EventDispatcher::FeedbackError() {
  if (!feedback_) {
    return;
  }
  try {
    feedback_->Error();
  } catch (const std::exception& ex) {
    PublishDispatchWarning("feedback_failed", ex.what());
  }
}

void EventDispatcher::DispatchEnrollResult(std::uint64_t device_id, std::uint32_t template_id,
                                           std::int32_t subject, std::int32_t remaining) {
  CheckDevice(device_id, "enroll_result");
  auto* session = coordinator_.active(SessionKind::kEnroll);
  if (session == nullptr) {
    return;
  }
  if (session->attached()) {
    FeedbackSuccess();
  }
  const auto outcome = session->SendEnrollResult(device_id, template_id, subject, remaining);
  if (remaining == 0) {
    AddTemplate(session->subject(), template_id);
  }
  if (outcome != SessionOutcome::kDone) {
    return;
  }
  if (remaining == 0) {
    coordinator_.RemoveSession(session);
  } else if (!coordinator_.StopEnrollment(session->caller(), false)) {
    // Caller went away mid-enrollment and the driver is gone too.
    coordinator_.RemoveSession(session);
  }
}

void EventDispatcher::DispatchAcquired(std::uint64_t device_id, std::int32_t acquired_info) {
  CheckDevice(device_id, "acquired");
  for (auto kind : {SessionKind::kEnroll, SessionKind::kAuthenticate}) {
    auto* session = coordinator_.active(kind);
    if (session == nullptr) {
      continue;
    }
    if (session->SendAcquired(device_id, acquired_info) == SessionOutcome::kDone) {
      coordinator_.RemoveSession(session);
    }
    return;
  }
}

void EventDispatcher::DispatchAuthenticated(std::uint64_t device_id, std::uint32_t template_id,
                                            std::int32_t subject) {
  CheckDevice(device_id, "authenticated");
  auto* session = coordinator_.active(SessionKind::kAuthenticate);
  if (session == nullptr) {
    return;
  }
  session->SendAuthenticated(device_id, template_id, subject);
  if (template_id == 0) {
    FeedbackError();
    if (lockout_.RecordFailure() == LockoutResult::kLockoutEntered) {
      if (!session->attached()) {
        PublishDispatchWarning("lockout_delivery_failed",
                               std::string(errors::msg::kLockoutDeliveryFailed));
      } else {
        session->SendError(device_id, SensorError::kLockout);
      }
    }
  } else {
    FeedbackSuccess();
    lockout_.RecordSuccess();
  }
  if (!coordinator_.StopAuthentication(session->caller(), false)) {
    coordinator_.RemoveSession(session);
  }
}

void EventDispatcher::DispatchError(std::uint64_t device_id, std::int32_t error) {
  CheckDevice(device_id, "error");
  const auto code = static_cast<SensorError>(error);
  if (auto* enroll = coordinator_.active(SessionKind::kEnroll)) {
    enroll->SendError(device_id, code);
    if (!coordinator_.StopEnrollment(enroll->caller(), false)) {
      coordinator_.RemoveSession(enroll);
    }
    return;
  }
  if (auto* auth = coordinator_.active(SessionKind::kAuthenticate)) {
    auth->SendError(device_id, code);
    if (!coordinator_.StopAuthentication(auth->caller(), false)) {
      coordinator_.RemoveSession(auth);
    }
    return;
  }
  if (auto* remove = coordinator_.active(SessionKind::kRemove)) {
    remove->SendError(device_id, code);
    coordinator_.RemoveSession(remove);
  }
}

void EventDispatcher::DispatchRemoved(std::uint64_t device_id, std::uint32_t template_id,
                                      std::int32_t subject) {
  CheckDevice(device_id, "removed");
  auto* session = coordinator_.active(SessionKind::kRemove);
  if (template_id != 0) {
    RemoveTemplate(session != nullptr ? session->subject() : subject, template_id);
  }
  if (session == nullptr) {
    return;
  }
  if (session->SendRemoved(device_id, template_id, subject) == SessionOutcome::kDone) {
    coordinator_.RemoveSession(session);
  }
}

void EventDispatcher::DispatchEnumerate(std::uint64_t device_id,
                                        const std::vector<std::uint32_t>& template_ids,
                                        const std::vector<std::int32_t>& subjects) {
  CheckDevice(device_id, "enumerate");
  if (template_ids.size() != subjects.size()) {
    PublishDispatchWarning("enumerate_length_mismatch",
                           std::string(errors::msg::kEnumerateLengthMismatch),
                           {EventField{"template_ids", JoinIds(template_ids)},
                            EventField{"subjects", JoinIds(subjects), FieldPrivacy::kHash}});
    return;
  }
  Event event{};
  event.category = EventCategory::kDiagnostics;
  event.severity = EventSeverity::kDebug;
  event.event_id = "driver_enumerate";
  event.message = "Driver enumerated templates";
  event.fields.emplace_back("count", std::to_string(template_ids.size()), FieldPrivacy::kPublic,
                            true);
  event.fields.emplace_back("template_ids", JoinIds(template_ids));
  EventBus::Instance().Publish(event);
}

}  // namespace fpc::orchestrator
