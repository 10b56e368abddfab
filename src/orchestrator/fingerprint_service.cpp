#include "fpc/orchestrator/fingerprint_service.h"

#include <string>
#include <system_error>
#include <utility>

#include "fpc/error.h"
#include "fpc/errors.h"
#include "fpc/orchestrator/event_bus.h"

namespace fpc::orchestrator {

namespace {

void RequireCaller(CallerToken caller) {
  if (caller == 0) {
    throw Error{ErrorDomain::Session, errors::session::kInvalidCaller,
                std::string(errors::msg::kInvalidCaller)};
  }
}

std::string_view PermissionName(Permission permission) {
  switch (permission) {
  case Permission::kManageFingerprint:
    return "manage_fingerprint";
  case Permission::kUseFingerprint:
    return "use_fingerprint";
  }
  return "unknown";
}

void PublishDenied(std::string event_id, std::string_view message, CallerToken caller,
                   std::string_view detail) {
  Event event{};
  event.category = EventCategory::kSecurity;
  event.severity = EventSeverity::kWarning;
  event.event_id = std::move(event_id);
  event.message = std::string(message);
  event.fields.emplace_back("caller", std::to_string(caller), FieldPrivacy::kHash);
  event.fields.emplace_back("detail", std::string(detail));
  EventBus::Instance().Publish(event);
}

}  // namespace

FingerprintService::FingerprintService(Dependencies deps, CoordinatorConfig config,
                                       ThreadingMode mode, SerialQueue::NowSource now)
    : config_(std::move(config)),
      deps_(std::move(deps)),
      mode_(mode),
      queue_(std::move(now)),
      liveness_(queue_),
      lockout_(queue_, LockoutPolicy::Settings{config_.max_failed_attempts,
                                               config_.lockout_duration}),
      connection_(queue_, deps_.registry),
      coordinator_(connection_, lockout_, liveness_,
                   SessionCoordinator::Settings{config_.enroll_timeout,
                                                config_.teardown_on_driver_reject}),
      dispatcher_(std::make_shared<EventDispatcher>(queue_, coordinator_, lockout_, connection_,
                                                    deps_.templates, deps_.feedback)) {
  // Requests posted before Start() may acquire the driver, so the sink must already be set.
  connection_.SetEventSink(dispatcher_);
}

FingerprintService::~FingerprintService() { Stop(); }

void FingerprintService::Start(std::int32_t initial_subject) {
  queue_.Post([this, initial_subject]() {
    if (!connection_.GetHandle()) {
      Event degraded{};
      degraded.category = EventCategory::kLifecycle;
      degraded.severity = EventSeverity::kWarning;
      degraded.event_id = "service_start_degraded";
      degraded.message = std::string(errors::msg::kDriverUnavailable);
      EventBus::Instance().Publish(degraded);
    }
    ApplyActiveSubject(initial_subject);
  });
  if (mode_ == ThreadingMode::kWorkerThread) {
    queue_.Start();
  }

  Event event{};
  event.category = EventCategory::kLifecycle;
  event.severity = EventSeverity::kInfo;
  event.event_id = "service_started";
  event.message = "Fingerprint service started";
  event.fields.emplace_back("mode", mode_ == ThreadingMode::kWorkerThread ? "worker" : "manual");
  EventBus::Instance().Publish(event);
}

void FingerprintService::Stop() {
  dispatcher_->Shutdown();
  queue_.Stop();
}

void FingerprintService::CheckPermission(CallerToken caller, Permission permission) {
  if (!deps_.access) {
    throw Error{ErrorDomain::Security, errors::security::kPermissionDenied,
                std::string(errors::msg::kPermissionDenied)};
  }
  try {
    deps_.access->CheckPermission(caller, permission);
  } catch (const Error&) {
    PublishDenied("permission_denied", errors::msg::kPermissionDenied, caller,
                  PermissionName(permission));
    throw;
  }
}

bool FingerprintService::CanUseSensor(CallerToken caller, const std::string& package) {
  CheckPermission(caller, Permission::kUseFingerprint);
  if (deps_.access && deps_.access->CanUseSensor(caller, package)) {
    return true;
  }
  PublishDenied("sensor_use_denied", errors::msg::kSensorUseDenied, caller, package);
  return false;
}

std::filesystem::path FingerprintService::SubjectStoragePath(std::int32_t subject) const {
  return config_.data_root / "users" / std::to_string(subject) / "fpdata";
}

void FingerprintService::ApplyActiveSubject(std::int32_t subject) {
  const auto path = SubjectStoragePath(subject);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    std::filesystem::create_directories(path, ec);
    if (ec) {
      Event event{};
      event.category = EventCategory::kDiagnostics;
      event.severity = EventSeverity::kError;
      event.event_id = "template_directory_failed";
      event.message = std::string(errors::msg::kStorageDirectoryFailed);
      event.fields.emplace_back("path", path.string(), FieldPrivacy::kHash);
      event.fields.emplace_back("error", ec.message());
      EventBus::Instance().Publish(event);
      return;
    }
  }
  connection_.SetActiveSubject(subject, path);
}

std::uint64_t FingerprintService::PreEnroll(CallerToken caller) {
  CheckPermission(caller, Permission::kManageFingerprint);
  return queue_.Invoke([this]() { return connection_.PreEnroll(); });
}

void FingerprintService::Enroll(CallerToken caller, EnrollRequest request,
                                std::shared_ptr<ResultSink> sink) {
  CheckPermission(caller, Permission::kManageFingerprint);
  RequireCaller(caller);
  queue_.Post([this, caller, request = std::move(request), sink = std::move(sink)]() mutable {
    coordinator_.StartEnrollment(caller, std::move(sink), request);
  });
}

void FingerprintService::CancelEnrollment(CallerToken caller) {
  CheckPermission(caller, Permission::kManageFingerprint);
  queue_.Post([this, caller]() { coordinator_.Cancel(SessionKind::kEnroll, caller); });
}

void FingerprintService::Authenticate(CallerToken caller, AuthenticateRequest request,
                                      std::shared_ptr<ResultSink> sink,
                                      const std::string& package) {
  if (!CanUseSensor(caller, package)) {
    return;
  }
  RequireCaller(caller);
  queue_.Post([this, caller, request, sink = std::move(sink)]() mutable {
    coordinator_.StartAuthentication(caller, std::move(sink), request);
  });
}

void FingerprintService::CancelAuthentication(CallerToken caller, const std::string& package) {
  if (!CanUseSensor(caller, package)) {
    return;
  }
  queue_.Post([this, caller]() { coordinator_.Cancel(SessionKind::kAuthenticate, caller); });
}

void FingerprintService::Remove(CallerToken caller, RemoveRequest request,
                                std::shared_ptr<ResultSink> sink) {
  CheckPermission(caller, Permission::kManageFingerprint);
  RequireCaller(caller);
  queue_.Post([this, caller, request, sink = std::move(sink)]() mutable {
    coordinator_.StartRemove(caller, std::move(sink), request);
  });
}

void FingerprintService::Rename(CallerToken caller, std::int32_t subject,
                                std::uint32_t template_id, std::string label) {
  CheckPermission(caller, Permission::kManageFingerprint);
  queue_.Post([this, subject, template_id, label = std::move(label)]() {
    if (deps_.templates) {
      deps_.templates->Rename(subject, template_id, label);
    }
  });
}

bool FingerprintService::IsHardwareDetected(CallerToken caller, const std::string& package) {
  if (!CanUseSensor(caller, package)) {
    return false;
  }
  return queue_.Invoke([this]() { return connection_.IsHardwareDetected(); });
}

std::vector<Template> FingerprintService::GetEnrolledTemplates(CallerToken caller,
                                                               std::int32_t subject,
                                                               const std::string& package) {
  if (!CanUseSensor(caller, package) || !deps_.templates) {
    return {};
  }
  return deps_.templates->List(subject);
}

bool FingerprintService::HasEnrolledTemplates(CallerToken caller, std::int32_t subject,
                                              const std::string& package) {
  return !GetEnrolledTemplates(caller, subject, package).empty();
}

std::uint64_t FingerprintService::GetAuthenticatorId(CallerToken caller,
                                                     const std::string& package) {
  if (!CanUseSensor(caller, package)) {
    return 0;
  }
  return queue_.Invoke([this]() { return connection_.GetAuthenticatorId(); });
}

void FingerprintService::OnActiveSubjectChanged(std::int32_t subject) {
  queue_.Post([this, subject]() { ApplyActiveSubject(subject); });
}

void FingerprintService::OnCallerDied(CallerToken caller) { liveness_.NotifyCallerDied(caller); }

}  // namespace fpc::orchestrator
