#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

#include "fpc/orchestrator/driver_connection.h"
#include "fpc/orchestrator/lockout_policy.h"
#include "fpc/orchestrator/serial_queue.h"
#include "fpc/orchestrator/session_coordinator.h"
#include "fpc/orchestrator/template_store.h"

namespace fpc::orchestrator {

// Haptic confirmation. Optional.
class FeedbackSink {
public:
  virtual ~FeedbackSink() = default;
  virtual void Success() = 0;
  virtual void Error() = 0;
};

// Receives driver callbacks on any thread, posts them onto the serial queue and routes each
// to the active session of the matching kind.
class EventDispatcher final : public DriverEventSink {
public:
  EventDispatcher(SerialQueue& queue, SessionCoordinator& coordinator, LockoutPolicy& lockout,
                  DriverConnection& driver, std::shared_ptr<TemplateStore> templates,
                  std::shared_ptr<FeedbackSink> feedback = nullptr);

  void OnEnrollResult(std::uint64_t device_id, std::uint32_t template_id, std::int32_t subject,
                      std::int32_t remaining) override;
  void OnAcquired(std::uint64_t device_id, std::int32_t acquired_info) override;
  void OnAuthenticated(std::uint64_t device_id, std::uint32_t template_id,
                       std::int32_t subject) override;
  void OnError(std::uint64_t device_id, std::int32_t error) override;
  void OnRemoved(std::uint64_t device_id, std::uint32_t template_id,
                 std::int32_t subject) override;
  void OnEnumerate(std::uint64_t device_id, std::vector<std::uint32_t> template_ids,
                   std::vector<std::int32_t> subjects) override;

  // Queue-side handlers.
  void DispatchEnrollResult(std::uint64_t device_id, std::uint32_t template_id,
                            std::int32_t subject, std::int32_t remaining);
  void DispatchAcquired(std::uint64_t device_id, std::int32_t acquired_info);
  void DispatchAuthenticated(std::uint64_t device_id, std::uint32_t template_id,
                             std::int32_t subject);
  void DispatchError(std::uint64_t device_id, std::int32_t error);
  void DispatchRemoved(std::uint64_t device_id, std::uint32_t template_id,
                       std::int32_t subject);
  void DispatchEnumerate(std::uint64_t device_id, const std::vector<std::uint32_t>& template_ids,
                         const std::vector<std::int32_t>& subjects);

  // Later driver callbacks are dropped instead of posted.
  void Shutdown() noexcept { detached_.store(true, std::memory_order_release); }

private:
  template <class Fn>
  void PostIfAttached(Fn&& fn);
  void CheckDevice(std::uint64_t device_id, const char* event) const;
  void AddTemplate(std::int32_t subject, std::uint32_t template_id);
  void RemoveTemplate(std::int32_t subject, std::uint32_t template_id);
  void FeedbackSuccess();
  void FeedbackError();

  SerialQueue& queue_;
  SessionCoordinator& coordinator_;
  LockoutPolicy& lockout_;
  DriverConnection& driver_;
  std::shared_ptr<TemplateStore> templates_;
  std::shared_ptr<FeedbackSink> feedback_;
  std::atomic<bool> detached_{false};
};

}  // namespace fpc::orchestrator
