#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

#include "fpc/orchestrator/driver_connection.h"
#include "fpc/orchestrator/liveness_registry.h"
#include "fpc/orchestrator/lockout_policy.h"
#include "fpc/orchestrator/session.h"

namespace fpc::orchestrator {

struct EnrollRequest {
  std::vector<std::uint8_t> auth_token;
  std::int32_t subject{0};
  std::int32_t flags{0};
};

struct AuthenticateRequest {
  std::uint64_t operation_id{0};
  std::int32_t subject{0};
  std::int32_t flags{0};
};

struct RemoveRequest {
  std::uint32_t template_id{0};
  std::int32_t subject{0};
};

// Owns at most one session per kind. Every method runs on the serial queue.
class SessionCoordinator {
public:
  struct Settings {
    std::chrono::seconds enroll_timeout{60};
    // When set, a start the driver rejects tears its session down with kHwUnavailable.
    bool teardown_on_driver_reject{false};
  };

  SessionCoordinator(DriverConnection& driver, LockoutPolicy& lockout,
                     LivenessRegistry& liveness);
  SessionCoordinator(DriverConnection& driver, LockoutPolicy& lockout,
                     LivenessRegistry& liveness, Settings settings);

  SessionCoordinator(const SessionCoordinator&) = delete;
  SessionCoordinator& operator=(const SessionCoordinator&) = delete;

  void StartEnrollment(CallerToken caller, std::shared_ptr<ResultSink> sink,
                       const EnrollRequest& request);
  void StartAuthentication(CallerToken caller, std::shared_ptr<ResultSink> sink,
                           const AuthenticateRequest& request);
  void StartRemove(CallerToken caller, std::shared_ptr<ResultSink> sink,
                   const RemoveRequest& request);

  // Cancels a pending enroll or authenticate session with a Canceled notification.
  void StopPendingOperations();

  // Silent no-op unless caller owns the active session of that kind. Returns true when the
  // session was torn down; an unavailable driver leaves it in place.
  bool StopEnrollment(CallerToken caller, bool notify);
  bool StopAuthentication(CallerToken caller, bool notify);
  void Cancel(SessionKind kind, CallerToken caller);

  // Clears the slot holding session and releases its death registration. Idempotent.
  void RemoveSession(const ClientSession* session);

  [[nodiscard]] ClientSession* active(SessionKind kind) const noexcept;
  [[nodiscard]] const Settings& settings() const noexcept { return settings_; }

private:
  std::unique_ptr<ClientSession> NewSession(SessionKind kind, CallerToken caller,
                                            std::shared_ptr<ResultSink> sink,
                                            std::int32_t subject);
  void OnCallerDied(SessionKind kind, const ClientSession* session);
  void HandleStartRejected(SessionKind kind, const DriverStatus& status);
  std::unique_ptr<ClientSession>& slot(SessionKind kind) noexcept;

  DriverConnection& driver_;
  LockoutPolicy& lockout_;
  LivenessRegistry& liveness_;
  Settings settings_;
  std::array<std::unique_ptr<ClientSession>, 3> slots_;
};

}  // namespace fpc::orchestrator
