#pragma once

#include <cstdint>
#include <memory>
#include <string_view>
#include <utility>

#include "fpc/orchestrator/liveness_registry.h"

namespace fpc::orchestrator {

enum class SessionKind { kEnroll, kAuthenticate, kRemove };

// Whether a session must be torn down after a notification.
enum class SessionOutcome { kContinuing, kDone };

// Error codes delivered to result sinks.
enum class SensorError : std::int32_t {
  kHwUnavailable = 1,
  kUnableToProcess = 2,
  kTimeout = 3,
  kNoSpace = 4,
  kCanceled = 5,
  kUnableToRemove = 6,
  kLockout = 7
};

std::string_view SessionKindName(SessionKind kind) noexcept;

// Caller-side callback surface. Implementations signal a dead or unreachable caller by
// throwing fpc::Error{Session, kSinkUnreachable}.
class ResultSink {
public:
  virtual ~ResultSink() = default;
  virtual void OnEnrollResult(std::uint64_t device_id, std::uint32_t template_id,
                              std::int32_t subject, std::int32_t remaining) = 0;
  virtual void OnAcquired(std::uint64_t device_id, std::int32_t acquired_info) = 0;
  virtual void OnAuthenticated(std::uint64_t device_id, std::uint32_t template_id,
                               std::int32_t subject) = 0;
  virtual void OnError(std::uint64_t device_id, SensorError error) = 0;
  virtual void OnRemoved(std::uint64_t device_id, std::uint32_t template_id,
                         std::int32_t subject) = 0;
};

// One in-flight operation bound to its caller. The liveness registration lives exactly as
// long as the session unless released earlier by teardown.
class ClientSession {
public:
  ClientSession(SessionKind kind, CallerToken caller, std::shared_ptr<ResultSink> sink,
                std::int32_t subject, LivenessRegistry::Registration liveness = {});

  ClientSession(const ClientSession&) = delete;
  ClientSession& operator=(const ClientSession&) = delete;

  SessionOutcome SendEnrollResult(std::uint64_t device_id, std::uint32_t template_id,
                                  std::int32_t subject, std::int32_t remaining);
  SessionOutcome SendAcquired(std::uint64_t device_id, std::int32_t acquired_info);
  SessionOutcome SendAuthenticated(std::uint64_t device_id, std::uint32_t template_id,
                                   std::int32_t subject);
  SessionOutcome SendError(std::uint64_t device_id, SensorError error);
  SessionOutcome SendRemoved(std::uint64_t device_id, std::uint32_t template_id,
                             std::int32_t subject);

  // Drops the sink; every later Send* resolves as kDone without a callback.
  void Detach() noexcept { sink_.reset(); }
  void ReleaseLiveness() noexcept { liveness_.Release(); }
  void BindLiveness(LivenessRegistry::Registration liveness) noexcept {
    liveness_ = std::move(liveness);
  }

  [[nodiscard]] SessionKind kind() const noexcept { return kind_; }
  [[nodiscard]] CallerToken caller() const noexcept { return caller_; }
  [[nodiscard]] std::int32_t subject() const noexcept { return subject_; }
  [[nodiscard]] bool attached() const noexcept { return sink_ != nullptr; }
  [[nodiscard]] bool liveness_registered() const noexcept { return liveness_.active(); }

private:
  template <class Deliver>
  bool TryDeliver(std::string_view what, Deliver&& deliver);

  SessionKind kind_;
  CallerToken caller_;
  std::shared_ptr<ResultSink> sink_;
  std::int32_t subject_;
  LivenessRegistry::Registration liveness_;
};

}  // namespace fpc::orchestrator
