#include "fpc/orchestrator/driver_connection.h"

#include <exception>
#include <string>
#include <utility>

#include "fpc/error.h"
#include "fpc/errors.h"
#include "fpc/orchestrator/event_bus.h"

namespace fpc::orchestrator {

namespace {

void PublishDriverEvent(EventSeverity severity, std::string event_id, std::string_view message,
                        std::string_view operation, std::optional<int> code = std::nullopt,
                        std::string_view reason = {}) {
  Event event{};
  event.category = EventCategory::kDiagnostics;
  event.severity = severity;
  event.event_id = std::move(event_id);
  event.message = std::string(message);
  if (!operation.empty()) {
    event.fields.emplace_back("operation", std::string(operation));
  }
  if (code) {
    event.fields.emplace_back("status", std::to_string(*code), FieldPrivacy::kPublic, true);
  }
  if (!reason.empty()) {
    event.fields.emplace_back("reason", std::string(reason));
  }
  EventBus::Instance().Publish(event);
}

}  // namespace

std::string_view DriverOutcomeName(DriverOutcome outcome) noexcept {
  switch (outcome) {
  case DriverOutcome::kOk:
    return "ok";
  case DriverOutcome::kUnavailable:
    return "unavailable";
  case DriverOutcome::kRejected:
    return "rejected";
  case DriverOutcome::kTransportError:
    return "transport_error";
  }
  return "unknown";
}

DriverConnection::DriverConnection(SerialQueue& queue, std::shared_ptr<DriverRegistry> registry)
    : queue_(queue), registry_(std::move(registry)), alive_(std::make_shared<int>(0)) {}

DriverConnection::~DriverConnection() { alive_.reset(); }

void DriverConnection::SetEventSink(std::shared_ptr<DriverEventSink> sink) {
  event_sink_ = std::move(sink);
}

std::shared_ptr<SensorDriver> DriverConnection::GetHandle() {
  if (driver_) {
    return driver_;
  }
  if (!registry_) {
    return nullptr;
  }

  std::shared_ptr<SensorDriver> handle;
  try {
    handle = registry_->Acquire();
  } catch (const Error& err) {
    PublishDriverEvent(EventSeverity::kWarning, "driver_acquire_failed",
                       errors::msg::kDriverUnavailable, "acquire", err.code, err.what());
    return nullptr;
  } catch (const std::exception& ex) {
    PublishDriverEvent(EventSeverity::kWarning, "driver_acquire_failed",
                       errors::msg::kDriverUnavailable, "acquire", std::nullopt, ex.what());
    return nullptr;
  }
  if (!handle) {
    return nullptr;
  }

  const auto generation = ++generation_;
  if (!Connect(handle, generation)) {
    return nullptr;
  }
  return driver_;
}

bool DriverConnection::Connect(const std::shared_ptr<SensorDriver>& handle,
                               std::uint64_t generation) {
  std::weak_ptr<int> alive = alive_;
  SerialQueue* queue = &queue_;
  try {
    handle->LinkToDeath([this, alive, queue, generation]() {
      if (alive.expired()) {
        return;
      }
      queue->Post([this, alive, generation]() {
        if (!alive.expired()) {
          HandleDriverDied(generation);
        }
      });
    });
  } catch (const Error& err) {
    // Dropping the handle makes the next access retry the whole acquisition.
    PublishDriverEvent(EventSeverity::kWarning, "driver_death_link_failed",
                       errors::msg::kDeathLinkFailed, "link_to_death", err.code, err.what());
    return false;
  } catch (const std::exception& ex) {
    PublishDriverEvent(EventSeverity::kWarning, "driver_death_link_failed",
                       errors::msg::kDeathLinkFailed, "link_to_death", std::nullopt, ex.what());
    return false;
  }

  try {
    if (event_sink_) {
      handle->Init(event_sink_);
    }
    device_id_ = handle->OpenHal();
  } catch (const Error& err) {
    PublishDriverEvent(EventSeverity::kError, "driver_open_failed",
                       errors::msg::kDriverTransportFailed, "open_hal", err.code, err.what());
    device_id_ = 0;
    return false;
  } catch (const std::exception& ex) {
    PublishDriverEvent(EventSeverity::kError, "driver_open_failed",
                       errors::msg::kDriverTransportFailed, "open_hal", std::nullopt, ex.what());
    device_id_ = 0;
    return false;
  }

  driver_ = handle;
  if (device_id_ == 0) {
    PublishDriverEvent(EventSeverity::kWarning, "driver_hal_missing",
                       "Driver reported no sensor hardware", "open_hal");
  }

  Event connected{};
  connected.category = EventCategory::kLifecycle;
  connected.severity = EventSeverity::kInfo;
  connected.event_id = "driver_connected";
  connected.message = "Fingerprint driver acquired";
  connected.fields.emplace_back("generation", std::to_string(generation), FieldPrivacy::kPublic,
                                true);
  connected.fields.emplace_back("device_id", std::to_string(device_id_), FieldPrivacy::kHash);
  EventBus::Instance().Publish(connected);

  if (active_subject_) {
    last_apply_status_ = ApplyActiveSubject(*handle);
  }
  return true;
}

DriverStatus DriverConnection::ApplyActiveSubject(SensorDriver& driver) {
  try {
    const int rc = driver.SetActiveSubject(active_subject_->subject, active_subject_->storage);
    if (rc != 0) {
      PublishDriverEvent(EventSeverity::kWarning, "driver_rejected",
                         errors::msg::kDriverRejected, "set_active_subject", rc);
      return DriverStatus{DriverOutcome::kRejected, rc};
    }
  } catch (const Error& err) {
    PublishDriverEvent(EventSeverity::kError, "driver_transport_failed",
                       errors::msg::kDriverTransportFailed, "set_active_subject", err.code,
                       err.what());
    return DriverStatus{DriverOutcome::kTransportError, err.native_code.value_or(err.code)};
  } catch (const std::exception& ex) {
    PublishDriverEvent(EventSeverity::kError, "driver_transport_failed",
                       errors::msg::kDriverTransportFailed, "set_active_subject", std::nullopt,
                       ex.what());
    return DriverStatus{DriverOutcome::kTransportError, errors::driver::kTransportFailed};
  }
  return DriverStatus{};
}

template <class Call>
DriverStatus DriverConnection::Forward(std::string_view operation, Call&& call) {
  auto handle = GetHandle();
  if (!handle) {
    PublishDriverEvent(EventSeverity::kWarning, "driver_unavailable",
                       errors::msg::kDriverUnavailable, operation);
    return DriverStatus{DriverOutcome::kUnavailable, 0};
  }
  try {
    const int rc = call(*handle);
    if (rc != 0) {
      PublishDriverEvent(EventSeverity::kWarning, "driver_rejected",
                         errors::msg::kDriverRejected, operation, rc);
      return DriverStatus{DriverOutcome::kRejected, rc};
    }
  } catch (const Error& err) {
    PublishDriverEvent(EventSeverity::kError, "driver_transport_failed",
                       errors::msg::kDriverTransportFailed, operation, err.code, err.what());
    return DriverStatus{DriverOutcome::kTransportError, err.native_code.value_or(err.code)};
  } catch (const std::exception& ex) {
    PublishDriverEvent(EventSeverity::kError, "driver_transport_failed",
                       errors::msg::kDriverTransportFailed, operation, std::nullopt, ex.what());
    return DriverStatus{DriverOutcome::kTransportError, errors::driver::kTransportFailed};
  }
  return DriverStatus{};
}

DriverStatus DriverConnection::BeginEnroll(std::span<const std::uint8_t> auth_token,
                                           std::int32_t subject,
                                           std::uint32_t timeout_seconds) {
  return Forward("enroll", [&](SensorDriver& driver) {
    return driver.Enroll(auth_token, subject, timeout_seconds);
  });
}

DriverStatus DriverConnection::CancelEnroll() {
  return Forward("cancel_enrollment",
                 [](SensorDriver& driver) { return driver.CancelEnrollment(); });
}

DriverStatus DriverConnection::BeginAuthenticate(std::uint64_t operation_id,
                                                 std::int32_t subject) {
  return Forward("authenticate", [&](SensorDriver& driver) {
    return driver.Authenticate(operation_id, subject);
  });
}

DriverStatus DriverConnection::CancelAuthenticate() {
  return Forward("cancel_authentication",
                 [](SensorDriver& driver) { return driver.CancelAuthentication(); });
}

DriverStatus DriverConnection::Remove(std::uint32_t template_id, std::int32_t subject) {
  return Forward("remove",
                 [&](SensorDriver& driver) { return driver.Remove(template_id, subject); });
}

DriverStatus DriverConnection::SetActiveSubject(std::int32_t subject,
                                                const std::filesystem::path& storage) {
  active_subject_ = ActiveSubject{subject, storage};
  if (!driver_) {
    // A fresh acquisition applies the remembered subject itself.
    if (!GetHandle()) {
      PublishDriverEvent(EventSeverity::kWarning, "driver_unavailable",
                         errors::msg::kDriverUnavailable, "set_active_subject");
      return DriverStatus{DriverOutcome::kUnavailable, 0};
    }
    return last_apply_status_;
  }
  last_apply_status_ = ApplyActiveSubject(*driver_);
  return last_apply_status_;
}

std::uint64_t DriverConnection::PreEnroll() {
  std::uint64_t token = 0;
  const auto status = Forward("pre_enroll", [&](SensorDriver& driver) {
    token = driver.PreEnroll();
    return 0;
  });
  return status.ok() ? token : 0;
}

std::uint64_t DriverConnection::GetAuthenticatorId() {
  std::uint64_t id = 0;
  const auto status = Forward("get_authenticator_id", [&](SensorDriver& driver) {
    id = driver.GetAuthenticatorId();
    return 0;
  });
  return status.ok() ? id : 0;
}

void DriverConnection::HandleDriverDied(std::uint64_t generation) {
  if (generation != generation_ || !driver_) {
    // Death of a handle that was already replaced.
    return;
  }
  driver_.reset();
  device_id_ = 0;
  PublishDriverEvent(EventSeverity::kWarning, "driver_died", errors::msg::kDriverDied, {});
}

}  // namespace fpc::orchestrator
