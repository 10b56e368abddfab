#pragma once

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "fpc/error.h"
#include "fpc/errors.h"
#include "fpc/orchestrator/driver_connection.h"
#include "fpc/orchestrator/event_bus.h"
#include "fpc/orchestrator/event_dispatcher.h"
#include "fpc/orchestrator/fingerprint_service.h"
#include "fpc/orchestrator/liveness_registry.h"
#include "fpc/orchestrator/lockout_policy.h"
#include "fpc/orchestrator/serial_queue.h"
#include "fpc/orchestrator/session.h"
#include "fpc/orchestrator/session_coordinator.h"
#include "fpc/orchestrator/template_store.h"

namespace fpc::test {

using namespace fpc::orchestrator;

inline void Require(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAILED: " << message << std::endl;
    std::abort();
  }
}

// Keeps test runs from writing audit logs into the working directory.
inline void DisableAuditLog() {
  ::setenv("FPC_AUDIT_LOG", "off", 1);
  ResetEventBusForTesting();
}

// Captures every published event until destroyed; the bus is reset on destruction.
class EventRecorder {
public:
  EventRecorder() : events_(std::make_shared<std::vector<Event>>()) {
    auto events = events_;
    EventBus::Instance().Subscribe([events](const Event& e) { events->push_back(e); });
  }
  ~EventRecorder() { ResetEventBusForTesting(); }

  EventRecorder(const EventRecorder&) = delete;
  EventRecorder& operator=(const EventRecorder&) = delete;

  std::size_t Count(const std::string& event_id) const {
    std::size_t n = 0;
    for (const auto& event : *events_) {
      if (event.event_id == event_id) {
        ++n;
      }
    }
    return n;
  }

  const Event* Find(const std::string& event_id) const {
    for (const auto& event : *events_) {
      if (event.event_id == event_id) {
        return &event;
      }
    }
    return nullptr;
  }

  static const EventField* Field(const Event& event, const std::string& key) {
    for (const auto& field : event.fields) {
      if (field.key == key) {
        return &field;
      }
    }
    return nullptr;
  }

private:
  std::shared_ptr<std::vector<Event>> events_;
};

class FakeClock {
public:
  SerialQueue::TimePoint now() const { return now_; }
  void Advance(SerialQueue::Duration delta) { now_ += delta; }
  SerialQueue::NowSource source() {
    return [this]() { return now_; };
  }

private:
  SerialQueue::TimePoint now_{std::chrono::hours(1)};
};

class RecordingDriver final : public SensorDriver {
public:
  void Init(std::shared_ptr<DriverEventSink> sink) override {
    ++init_calls;
    event_sink = std::move(sink);
  }
  std::uint64_t OpenHal() override {
    ++open_hal_calls;
    if (throw_on_open) {
      throw std::runtime_error("hal open failed");
    }
    return device_id;
  }
  int CloseHal() override { return 0; }
  std::uint64_t PreEnroll() override {
    ThrowIfBroken();
    return pre_enroll_token;
  }
  int Enroll(std::span<const std::uint8_t> token, std::int32_t subject,
             std::uint32_t timeout_seconds) override {
    ThrowIfBroken();
    ++enroll_calls;
    last_token.assign(token.begin(), token.end());
    last_subject = subject;
    last_timeout = timeout_seconds;
    return enroll_status;
  }
  int CancelEnrollment() override {
    ThrowIfBroken();
    ++cancel_enroll_calls;
    return 0;
  }
  int Authenticate(std::uint64_t operation_id, std::int32_t subject) override {
    ThrowIfBroken();
    ++authenticate_calls;
    last_operation = operation_id;
    last_subject = subject;
    return authenticate_status;
  }
  int CancelAuthentication() override {
    ThrowIfBroken();
    ++cancel_authenticate_calls;
    return 0;
  }
  int Remove(std::uint32_t template_id, std::int32_t subject) override {
    ThrowIfBroken();
    ++remove_calls;
    last_template = template_id;
    last_subject = subject;
    return remove_status;
  }
  int SetActiveSubject(std::int32_t subject, const std::filesystem::path& storage) override {
    ThrowIfBroken();
    ++set_subject_calls;
    active_subject = subject;
    active_storage = storage;
    return 0;
  }
  std::uint64_t GetAuthenticatorId() override {
    ThrowIfBroken();
    return authenticator_id;
  }
  void LinkToDeath(std::function<void()> callback) override {
    if (throw_on_link) {
      throw std::runtime_error("death link lost");
    }
    if (fail_link) {
      throw Error{ErrorDomain::Driver, errors::driver::kDeathLinkFailed,
                  std::string(errors::msg::kDeathLinkFailed)};
    }
    on_death = std::move(callback);
  }

  void Die() {
    auto callback = on_death;
    if (callback) {
      callback();
    }
  }

  std::uint64_t device_id{0xD1};
  std::uint64_t pre_enroll_token{0x1234};
  std::uint64_t authenticator_id{0xAB};
  int enroll_status{0};
  int authenticate_status{0};
  int remove_status{0};
  bool fail_link{false};
  bool throw_on_link{false};
  bool throw_on_open{false};
  bool broken{false};

  int init_calls{0};
  int open_hal_calls{0};
  int enroll_calls{0};
  int cancel_enroll_calls{0};
  int authenticate_calls{0};
  int cancel_authenticate_calls{0};
  int remove_calls{0};
  int set_subject_calls{0};
  std::vector<std::uint8_t> last_token;
  std::int32_t last_subject{-1};
  std::uint32_t last_timeout{0};
  std::uint64_t last_operation{0};
  std::uint32_t last_template{0};
  std::int32_t active_subject{-1};
  std::filesystem::path active_storage;
  std::shared_ptr<DriverEventSink> event_sink;
  std::function<void()> on_death;

private:
  void ThrowIfBroken() const {
    if (broken) {
      throw Error{ErrorDomain::Driver, errors::driver::kTransportFailed,
                  std::string(errors::msg::kDriverTransportFailed), 32, Retryability::kTransient};
    }
  }
};

class FakeRegistry final : public DriverRegistry {
public:
  FakeRegistry() : driver(std::make_shared<RecordingDriver>()) {}

  std::shared_ptr<SensorDriver> Acquire() override {
    ++acquire_calls;
    if (throw_on_acquire) {
      throw std::runtime_error("registry offline");
    }
    if (!available) {
      return nullptr;
    }
    return driver;
  }

  std::shared_ptr<RecordingDriver> driver;
  bool available{true};
  bool throw_on_acquire{false};
  int acquire_calls{0};
};

class RecordingSink final : public ResultSink {
public:
  enum class Kind { kEnrollResult, kAcquired, kAuthenticated, kError, kRemoved };

  struct Record {
    Kind kind;
    std::uint32_t template_id{0};
    std::int32_t subject{0};
    std::int32_t value{0};
  };

  void OnEnrollResult(std::uint64_t, std::uint32_t template_id, std::int32_t subject,
                      std::int32_t remaining) override {
    Deliver(Record{Kind::kEnrollResult, template_id, subject, remaining});
  }
  void OnAcquired(std::uint64_t, std::int32_t info) override {
    Deliver(Record{Kind::kAcquired, 0, 0, info});
  }
  void OnAuthenticated(std::uint64_t, std::uint32_t template_id, std::int32_t subject) override {
    Deliver(Record{Kind::kAuthenticated, template_id, subject, 0});
  }
  void OnError(std::uint64_t, SensorError error) override {
    Deliver(Record{Kind::kError, 0, 0, static_cast<std::int32_t>(error)});
  }
  void OnRemoved(std::uint64_t, std::uint32_t template_id, std::int32_t subject) override {
    Deliver(Record{Kind::kRemoved, template_id, subject, 0});
  }

  std::size_t Count(Kind kind) const {
    std::size_t n = 0;
    for (const auto& record : records) {
      if (record.kind == kind) {
        ++n;
      }
    }
    return n;
  }

  std::size_t CountErrors(SensorError error) const {
    std::size_t n = 0;
    for (const auto& record : records) {
      if (record.kind == Kind::kError && record.value == static_cast<std::int32_t>(error)) {
        ++n;
      }
    }
    return n;
  }

  std::vector<Record> records;
  bool unreachable{false};

private:
  void Deliver(Record record) {
    if (unreachable) {
      throw Error{ErrorDomain::Session, errors::session::kSinkUnreachable,
                  std::string(errors::msg::kSinkUnreachable)};
    }
    records.push_back(record);
  }
};

class RecordingTemplateStore final : public TemplateStore {
public:
  void Add(std::int32_t subject, std::uint32_t template_id) override {
    adds.emplace_back(subject, template_id);
    inner_.Add(subject, template_id);
  }
  void Remove(std::int32_t subject, std::uint32_t template_id) override {
    removes.emplace_back(subject, template_id);
    inner_.Remove(subject, template_id);
  }
  std::vector<Template> List(std::int32_t subject) const override { return inner_.List(subject); }
  void Rename(std::int32_t subject, std::uint32_t template_id,
              const std::string& label) override {
    inner_.Rename(subject, template_id, label);
  }

  std::vector<std::pair<std::int32_t, std::uint32_t>> adds;
  std::vector<std::pair<std::int32_t, std::uint32_t>> removes;

private:
  MemoryTemplateStore inner_;
};

class FakeAccessPolicy final : public AccessPolicy {
public:
  void CheckPermission(CallerToken caller, Permission permission) override {
    if (denied_permissions.count({caller, permission}) != 0) {
      throw Error{ErrorDomain::Security, errors::security::kPermissionDenied,
                  std::string(errors::msg::kPermissionDenied)};
    }
  }
  bool CanUseSensor(CallerToken caller, const std::string& package) override {
    return denied_callers.count(caller) == 0 && package != "blocked.package";
  }

  std::set<std::pair<CallerToken, Permission>> denied_permissions;
  std::set<CallerToken> denied_callers;
};

class RecordingFeedback final : public FeedbackSink {
public:
  void Success() override { ++successes; }
  void Error() override { ++errors; }

  int successes{0};
  int errors{0};
};

// Coordinator stack on a manual queue driven by a fake clock.
struct Harness {
  explicit Harness(SessionCoordinator::Settings coordinator_settings = {},
                   LockoutPolicy::Settings lockout_settings = {})
      : registry(std::make_shared<FakeRegistry>()),
        templates(std::make_shared<RecordingTemplateStore>()),
        feedback(std::make_shared<RecordingFeedback>()),
        queue(clock.source()),
        liveness(queue),
        lockout(queue, lockout_settings),
        connection(queue, registry),
        coordinator(connection, lockout, liveness, coordinator_settings),
        dispatcher(std::make_shared<EventDispatcher>(queue, coordinator, lockout, connection,
                                                     templates, feedback)) {
    connection.SetEventSink(dispatcher);
  }

  RecordingDriver& driver() { return *registry->driver; }

  void Advance(SerialQueue::Duration delta) {
    clock.Advance(delta);
    queue.RunPending();
  }

  FakeClock clock;
  std::shared_ptr<FakeRegistry> registry;
  std::shared_ptr<RecordingTemplateStore> templates;
  std::shared_ptr<RecordingFeedback> feedback;
  SerialQueue queue;
  LivenessRegistry liveness;
  LockoutPolicy lockout;
  DriverConnection connection;
  SessionCoordinator coordinator;
  std::shared_ptr<EventDispatcher> dispatcher;
};

inline EnrollRequest MakeEnroll(std::int32_t subject) {
  EnrollRequest request{};
  request.auth_token = {1, 2, 3, 4};
  request.subject = subject;
  return request;
}

inline AuthenticateRequest MakeAuthenticate(std::int32_t subject, std::uint64_t op = 77) {
  AuthenticateRequest request{};
  request.operation_id = op;
  request.subject = subject;
  return request;
}

}  // namespace fpc::test
