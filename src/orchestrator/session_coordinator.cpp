#include "fpc/orchestrator/session_coordinator.h"

#include <span>
#include <string>
#include <utility>

#include "fpc/errors.h"
#include "fpc/orchestrator/event_bus.h"

namespace fpc::orchestrator {

namespace {

void PublishSessionEvent(EventSeverity severity, std::string event_id, std::string message,
                         SessionKind kind, CallerToken caller,
                         std::optional<std::int32_t> subject = std::nullopt) {
  Event event{};
  event.category = EventCategory::kLifecycle;
  event.severity = severity;
  event.event_id = std::move(event_id);
  event.message = std::move(message);
  event.fields.emplace_back("kind", std::string(SessionKindName(kind)));
  event.fields.emplace_back("caller", std::to_string(caller), FieldPrivacy::kHash);
  if (subject) {
    event.fields.emplace_back("subject", std::to_string(*subject), FieldPrivacy::kHash);
  }
  EventBus::Instance().Publish(event);
}

}  // namespace

SessionCoordinator::SessionCoordinator(DriverConnection& driver, LockoutPolicy& lockout,
                                       LivenessRegistry& liveness)
    : SessionCoordinator(driver, lockout, liveness, Settings{}) {}

SessionCoordinator::SessionCoordinator(DriverConnection& driver, LockoutPolicy& lockout,
                                       LivenessRegistry& liveness, Settings settings)
    : driver_(driver), lockout_(lockout), liveness_(liveness), settings_(settings) {}

std::unique_ptr<ClientSession>& SessionCoordinator::slot(SessionKind kind) noexcept {
  return slots_[static_cast<std::size_t>(kind)];
}

ClientSession* SessionCoordinator::active(SessionKind kind) const noexcept {
  return slots_[static_cast<std::size_t>(kind)].get();
}

std::unique_ptr<ClientSession> SessionCoordinator::NewSession(SessionKind kind,
                                                              CallerToken caller,
                                                              std::shared_ptr<ResultSink> sink,
                                                              std::int32_t subject) {
  auto session = std::make_unique<ClientSession>(kind, caller, std::move(sink), subject);
  const ClientSession* raw = session.get();
  session->BindLiveness(
      liveness_.Register(caller, [this, kind, raw]() { OnCallerDied(kind, raw); }));
  return session;
}

void SessionCoordinator::OnCallerDied(SessionKind kind, const ClientSession* session) {
  auto& current = slot(kind);
  if (current.get() != session) {
    return;
  }
  PublishSessionEvent(EventSeverity::kInfo, "session_peer_gone",
                      "Caller died; session torn down", kind, current->caller());
  current->Detach();
  RemoveSession(session);
}

void SessionCoordinator::HandleStartRejected(SessionKind kind, const DriverStatus& status) {
  auto* session = active(kind);
  if (session == nullptr) {
    return;
  }
  // TODO: make teardown the default once callers handle kHwUnavailable on start.
  if (!settings_.teardown_on_driver_reject) {
    PublishSessionEvent(EventSeverity::kWarning, "session_start_rejected",
                        "Driver rejected start (status " + std::to_string(status.code) +
                            "); session kept",
                        kind, session->caller());
    return;
  }
  PublishSessionEvent(EventSeverity::kWarning, "session_start_rejected",
                      "Driver rejected start (status " + std::to_string(status.code) +
                          "); session torn down",
                      kind, session->caller());
  session->SendError(driver_.device_id(), SensorError::kHwUnavailable);
  RemoveSession(session);
}

void SessionCoordinator::StartEnrollment(CallerToken caller, std::shared_ptr<ResultSink> sink,
                                         const EnrollRequest& request) {
  if (!driver_.GetHandle()) {
    PublishSessionEvent(EventSeverity::kWarning, "session_start_aborted",
                        std::string(errors::msg::kDriverUnavailable), SessionKind::kEnroll,
                        caller);
    return;
  }
  StopPendingOperations();
  slot(SessionKind::kEnroll) =
      NewSession(SessionKind::kEnroll, caller, std::move(sink), request.subject);
  PublishSessionEvent(EventSeverity::kInfo, "session_started", "Enrollment started",
                      SessionKind::kEnroll, caller, request.subject);

  const auto timeout = static_cast<std::uint32_t>(settings_.enroll_timeout.count());
  const auto status = driver_.BeginEnroll(
      std::span<const std::uint8_t>(request.auth_token.data(), request.auth_token.size()),
      request.subject, timeout);
  if (!status.ok()) {
    HandleStartRejected(SessionKind::kEnroll, status);
  }
}

void SessionCoordinator::StartAuthentication(CallerToken caller,
                                             std::shared_ptr<ResultSink> sink,
                                             const AuthenticateRequest& request) {
  if (!driver_.GetHandle()) {
    PublishSessionEvent(EventSeverity::kWarning, "session_start_aborted",
                        std::string(errors::msg::kDriverUnavailable),
                        SessionKind::kAuthenticate, caller);
    return;
  }
  StopPendingOperations();

  if (lockout_.IsLocked()) {
    // Resolved on the spot; never slotted and never registered for caller death.
    ClientSession rejected(SessionKind::kAuthenticate, caller, std::move(sink),
                           request.subject);
    PublishSessionEvent(EventSeverity::kWarning, "authentication_locked_out",
                        std::string(errors::msg::kLockoutActive), SessionKind::kAuthenticate,
                        caller, request.subject);
    if (!rejected.attached()) {
      PublishSessionEvent(EventSeverity::kWarning, "lockout_delivery_failed",
                          std::string(errors::msg::kLockoutDeliveryFailed),
                          SessionKind::kAuthenticate, caller);
      return;
    }
    rejected.SendError(driver_.device_id(), SensorError::kLockout);
    return;
  }

  slot(SessionKind::kAuthenticate) =
      NewSession(SessionKind::kAuthenticate, caller, std::move(sink), request.subject);
  PublishSessionEvent(EventSeverity::kInfo, "session_started", "Authentication started",
                      SessionKind::kAuthenticate, caller, request.subject);

  const auto status = driver_.BeginAuthenticate(request.operation_id, request.subject);
  if (!status.ok()) {
    HandleStartRejected(SessionKind::kAuthenticate, status);
  }
}

void SessionCoordinator::StartRemove(CallerToken caller, std::shared_ptr<ResultSink> sink,
                                     const RemoveRequest& request) {
  if (!driver_.GetHandle()) {
    PublishSessionEvent(EventSeverity::kWarning, "session_start_aborted",
                        std::string(errors::msg::kDriverUnavailable), SessionKind::kRemove,
                        caller);
    return;
  }
  if (auto* previous = active(SessionKind::kRemove)) {
    previous->SendError(driver_.device_id(), SensorError::kCanceled);
    RemoveSession(previous);
  }
  slot(SessionKind::kRemove) =
      NewSession(SessionKind::kRemove, caller, std::move(sink), request.subject);
  PublishSessionEvent(EventSeverity::kInfo, "session_started", "Removal started",
                      SessionKind::kRemove, caller, request.subject);

  const auto status = driver_.Remove(request.template_id, request.subject);
  if (!status.ok()) {
    HandleStartRejected(SessionKind::kRemove, status);
  }
}

void SessionCoordinator::StopPendingOperations() {
  if (auto* enroll = active(SessionKind::kEnroll)) {
    StopEnrollment(enroll->caller(), true);
  }
  if (auto* auth = active(SessionKind::kAuthenticate)) {
    StopAuthentication(auth->caller(), true);
  }
}

bool SessionCoordinator::StopEnrollment(CallerToken caller, bool notify) {
  auto* session = active(SessionKind::kEnroll);
  if (session == nullptr || session->caller() != caller) {
    return false;
  }
  if (!driver_.GetHandle()) {
    PublishSessionEvent(EventSeverity::kWarning, "session_stop_skipped",
                        std::string(errors::msg::kDriverUnavailable), SessionKind::kEnroll,
                        caller);
    return false;
  }
  driver_.CancelEnroll();
  if (notify) {
    session->SendError(driver_.device_id(), SensorError::kCanceled);
  }
  RemoveSession(session);
  return true;
}

bool SessionCoordinator::StopAuthentication(CallerToken caller, bool notify) {
  auto* session = active(SessionKind::kAuthenticate);
  if (session == nullptr || session->caller() != caller) {
    return false;
  }
  if (!driver_.GetHandle()) {
    PublishSessionEvent(EventSeverity::kWarning, "session_stop_skipped",
                        std::string(errors::msg::kDriverUnavailable),
                        SessionKind::kAuthenticate, caller);
    return false;
  }
  driver_.CancelAuthenticate();
  if (notify) {
    session->SendError(driver_.device_id(), SensorError::kCanceled);
  }
  RemoveSession(session);
  return true;
}

void SessionCoordinator::Cancel(SessionKind kind, CallerToken caller) {
  switch (kind) {
  case SessionKind::kEnroll:
    StopEnrollment(caller, true);
    return;
  case SessionKind::kAuthenticate:
    StopAuthentication(caller, true);
    return;
  case SessionKind::kRemove: {
    auto* session = active(SessionKind::kRemove);
    if (session == nullptr || session->caller() != caller) {
      return;
    }
    session->SendError(driver_.device_id(), SensorError::kCanceled);
    RemoveSession(session);
    return;
  }
  }
}

void SessionCoordinator::RemoveSession(const ClientSession* session) {
  if (session == nullptr) {
    return;
  }
  auto& current = slot(session->kind());
  if (current.get() != session) {
    return;
  }
  std::unique_ptr<ClientSession> doomed = std::move(current);
  doomed->ReleaseLiveness();
  PublishSessionEvent(EventSeverity::kDebug, "session_removed", "Session torn down",
                      doomed->kind(), doomed->caller());
}

}  // namespace fpc::orchestrator
