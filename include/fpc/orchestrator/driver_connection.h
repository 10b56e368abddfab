#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "fpc/orchestrator/serial_queue.h"

namespace fpc::orchestrator {

// Asynchronous callbacks emitted by the sensor driver, from any thread.
class DriverEventSink {
public:
  virtual ~DriverEventSink() = default;
  virtual void OnEnrollResult(std::uint64_t device_id, std::uint32_t template_id,
                              std::int32_t subject, std::int32_t remaining) = 0;
  virtual void OnAcquired(std::uint64_t device_id, std::int32_t acquired_info) = 0;
  virtual void OnAuthenticated(std::uint64_t device_id, std::uint32_t template_id,
                               std::int32_t subject) = 0;
  virtual void OnError(std::uint64_t device_id, std::int32_t error) = 0;
  virtual void OnRemoved(std::uint64_t device_id, std::uint32_t template_id,
                         std::int32_t subject) = 0;
  virtual void OnEnumerate(std::uint64_t device_id, std::vector<std::uint32_t> template_ids,
                           std::vector<std::int32_t> subjects) = 0;
};

// Remote sensor driver. Status returns are 0 on success. Transport failures are thrown as
// fpc::Error in the Driver domain.
class SensorDriver {
public:
  virtual ~SensorDriver() = default;
  virtual void Init(std::shared_ptr<DriverEventSink> sink) = 0;
  virtual std::uint64_t OpenHal() = 0;
  virtual int CloseHal() = 0;
  virtual std::uint64_t PreEnroll() = 0;
  virtual int Enroll(std::span<const std::uint8_t> auth_token, std::int32_t subject,
                     std::uint32_t timeout_seconds) = 0;
  virtual int CancelEnrollment() = 0;
  virtual int Authenticate(std::uint64_t operation_id, std::int32_t subject) = 0;
  virtual int CancelAuthentication() = 0;
  virtual int Remove(std::uint32_t template_id, std::int32_t subject) = 0;
  virtual int SetActiveSubject(std::int32_t subject, const std::filesystem::path& storage) = 0;
  virtual std::uint64_t GetAuthenticatorId() = 0;
  virtual void LinkToDeath(std::function<void()> on_death) = 0;
};

class DriverRegistry {
public:
  virtual ~DriverRegistry() = default;
  // Returns nullptr when the driver is not running.
  virtual std::shared_ptr<SensorDriver> Acquire() = 0;
};

enum class DriverOutcome { kOk, kUnavailable, kRejected, kTransportError };

struct DriverStatus {
  DriverOutcome outcome{DriverOutcome::kOk};
  int code{0};

  [[nodiscard]] bool ok() const noexcept { return outcome == DriverOutcome::kOk; }
};

std::string_view DriverOutcomeName(DriverOutcome outcome) noexcept;

// Owns the process-wide driver handle. Lives on the serial queue; only the death callback
// it installs runs elsewhere, and that just posts back onto the queue.
class DriverConnection {
public:
  DriverConnection(SerialQueue& queue, std::shared_ptr<DriverRegistry> registry);
  ~DriverConnection();

  DriverConnection(const DriverConnection&) = delete;
  DriverConnection& operator=(const DriverConnection&) = delete;

  // Installed with Init() on every (re-)acquisition.
  void SetEventSink(std::shared_ptr<DriverEventSink> sink);

  // Returns the cached handle or acquires a new one; nullptr when unavailable.
  std::shared_ptr<SensorDriver> GetHandle();

  DriverStatus BeginEnroll(std::span<const std::uint8_t> auth_token, std::int32_t subject,
                           std::uint32_t timeout_seconds);
  DriverStatus CancelEnroll();
  DriverStatus BeginAuthenticate(std::uint64_t operation_id, std::int32_t subject);
  DriverStatus CancelAuthenticate();
  DriverStatus Remove(std::uint32_t template_id, std::int32_t subject);
  DriverStatus SetActiveSubject(std::int32_t subject, const std::filesystem::path& storage);
  // Both return 0 when the driver is unavailable or the call failed.
  std::uint64_t PreEnroll();
  std::uint64_t GetAuthenticatorId();

  void HandleDriverDied(std::uint64_t generation);

  [[nodiscard]] bool IsHardwareDetected() const noexcept { return device_id_ != 0; }
  [[nodiscard]] std::uint64_t device_id() const noexcept { return device_id_; }
  [[nodiscard]] bool connected() const noexcept { return driver_ != nullptr; }
  [[nodiscard]] std::uint64_t generation() const noexcept { return generation_; }

private:
  struct ActiveSubject {
    std::int32_t subject{0};
    std::filesystem::path storage;
  };

  template <class Call>
  DriverStatus Forward(std::string_view operation, Call&& call);
  bool Connect(const std::shared_ptr<SensorDriver>& handle, std::uint64_t generation);
  DriverStatus ApplyActiveSubject(SensorDriver& driver);

  SerialQueue& queue_;
  std::shared_ptr<DriverRegistry> registry_;
  std::shared_ptr<DriverEventSink> event_sink_;
  std::shared_ptr<SensorDriver> driver_;
  std::uint64_t device_id_{0};
  std::uint64_t generation_{0};
  std::optional<ActiveSubject> active_subject_;
  DriverStatus last_apply_status_{};
  std::shared_ptr<int> alive_;
};

}  // namespace fpc::orchestrator
