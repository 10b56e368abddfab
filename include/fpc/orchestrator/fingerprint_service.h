#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "fpc/orchestrator/config.h"
#include "fpc/orchestrator/driver_connection.h"
#include "fpc/orchestrator/event_dispatcher.h"
#include "fpc/orchestrator/liveness_registry.h"
#include "fpc/orchestrator/lockout_policy.h"
#include "fpc/orchestrator/serial_queue.h"
#include "fpc/orchestrator/session_coordinator.h"
#include "fpc/orchestrator/template_store.h"

namespace fpc::orchestrator {

enum class Permission { kManageFingerprint, kUseFingerprint };

class AccessPolicy {
public:
  virtual ~AccessPolicy() = default;
  // Throws fpc::Error{Security, kPermissionDenied} when the caller lacks permission.
  virtual void CheckPermission(CallerToken caller, Permission permission) = 0;
  virtual bool CanUseSensor(CallerToken caller, const std::string& package) = 0;
};

// Caller-facing entry point. Checks capabilities on the calling thread and funnels every
// request onto the serial queue.
class FingerprintService {
public:
  enum class ThreadingMode { kWorkerThread, kManual };

  struct Dependencies {
    std::shared_ptr<DriverRegistry> registry;
    std::shared_ptr<TemplateStore> templates;
    std::shared_ptr<AccessPolicy> access;
    std::shared_ptr<FeedbackSink> feedback;
  };

  explicit FingerprintService(Dependencies deps, CoordinatorConfig config = {},
                              ThreadingMode mode = ThreadingMode::kWorkerThread,
                              SerialQueue::NowSource now = {});
  ~FingerprintService();

  FingerprintService(const FingerprintService&) = delete;
  FingerprintService& operator=(const FingerprintService&) = delete;

  // Acquires the driver and applies the initial subject.
  void Start(std::int32_t initial_subject);
  void Stop();

  std::uint64_t PreEnroll(CallerToken caller);
  void Enroll(CallerToken caller, EnrollRequest request, std::shared_ptr<ResultSink> sink);
  void CancelEnrollment(CallerToken caller);
  void Authenticate(CallerToken caller, AuthenticateRequest request,
                    std::shared_ptr<ResultSink> sink, const std::string& package);
  void CancelAuthentication(CallerToken caller, const std::string& package);
  void Remove(CallerToken caller, RemoveRequest request, std::shared_ptr<ResultSink> sink);
  void Rename(CallerToken caller, std::int32_t subject, std::uint32_t template_id,
              std::string label);

  bool IsHardwareDetected(CallerToken caller, const std::string& package);
  std::vector<Template> GetEnrolledTemplates(CallerToken caller, std::int32_t subject,
                                             const std::string& package);
  bool HasEnrolledTemplates(CallerToken caller, std::int32_t subject,
                            const std::string& package);
  std::uint64_t GetAuthenticatorId(CallerToken caller, const std::string& package);

  void OnActiveSubjectChanged(std::int32_t subject);
  void OnCallerDied(CallerToken caller);

  [[nodiscard]] std::filesystem::path SubjectStoragePath(std::int32_t subject) const;

  [[nodiscard]] const CoordinatorConfig& config() const noexcept { return config_; }
  SerialQueue& queue() noexcept { return queue_; }
  SessionCoordinator& coordinator() noexcept { return coordinator_; }
  LockoutPolicy& lockout() noexcept { return lockout_; }
  DriverConnection& connection() noexcept { return connection_; }
  EventDispatcher& dispatcher() noexcept { return *dispatcher_; }

private:
  void CheckPermission(CallerToken caller, Permission permission);
  // Throws like CheckPermission without kUseFingerprint; false when the policy refuses the
  // package.
  bool CanUseSensor(CallerToken caller, const std::string& package);
  void ApplyActiveSubject(std::int32_t subject);

  CoordinatorConfig config_;
  Dependencies deps_;
  ThreadingMode mode_;
  SerialQueue queue_;
  LivenessRegistry liveness_;
  LockoutPolicy lockout_;
  DriverConnection connection_;
  SessionCoordinator coordinator_;
  std::shared_ptr<EventDispatcher> dispatcher_;
};

}  // namespace fpc::orchestrator
