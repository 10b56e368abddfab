#include "fakes.h"

#include <memory>

namespace {

using fpc::test::Harness;
using fpc::test::MakeAuthenticate;
using fpc::test::MakeEnroll;
using fpc::test::RecordingSink;
using fpc::test::Require;
using namespace fpc::orchestrator;

void TestEnrollForwardsRequest() {
  Harness h;
  auto sink = std::make_shared<RecordingSink>();
  h.coordinator.StartEnrollment(1, sink, MakeEnroll(10));
  Require(h.coordinator.active(SessionKind::kEnroll) != nullptr, "enroll session slotted");
  Require(h.driver().enroll_calls == 1, "driver asked to enroll");
  Require(h.driver().last_timeout == 60, "sixty second enrollment timeout");
  Require(h.driver().last_token == std::vector<std::uint8_t>({1, 2, 3, 4}), "token forwarded");
  Require(h.liveness.IsRegistered(1), "caller linked for death");
}

void TestPreemptionCancelsExactlyOnce() {
  Harness h;
  auto enroll_sink = std::make_shared<RecordingSink>();
  auto auth_sink = std::make_shared<RecordingSink>();
  auto second_enroll_sink = std::make_shared<RecordingSink>();

  h.coordinator.StartEnrollment(1, enroll_sink, MakeEnroll(10));
  h.coordinator.StartAuthentication(2, auth_sink, MakeAuthenticate(10));
  Require(enroll_sink->records.size() == 1, "preempted enroll notified once");
  Require(enroll_sink->CountErrors(SensorError::kCanceled) == 1, "preempted with Canceled");
  Require(h.driver().cancel_enroll_calls == 1, "driver enrollment canceled");
  Require(h.coordinator.active(SessionKind::kEnroll) == nullptr, "enroll slot cleared");
  Require(h.coordinator.active(SessionKind::kAuthenticate) != nullptr, "auth slotted");
  Require(!h.liveness.IsRegistered(1), "preempted caller unlinked");

  h.coordinator.StartEnrollment(3, second_enroll_sink, MakeEnroll(10));
  Require(auth_sink->CountErrors(SensorError::kCanceled) == 1, "auth preempted once");
  Require(h.driver().cancel_authenticate_calls == 1, "driver authentication canceled");
  Require(h.coordinator.active(SessionKind::kAuthenticate) == nullptr, "auth slot cleared");
  Require(h.coordinator.active(SessionKind::kEnroll)->caller() == 3, "new enroll owner");
  Require(h.liveness.size() == 1, "one live registration");
}

void TestRepeatedStartsKeepOneSessionPerKind() {
  Harness h;
  std::vector<std::shared_ptr<RecordingSink>> sinks;
  for (CallerToken caller = 1; caller <= 5; ++caller) {
    sinks.push_back(std::make_shared<RecordingSink>());
    if (caller % 2 == 0) {
      h.coordinator.StartAuthentication(caller, sinks.back(), MakeAuthenticate(0));
    } else {
      h.coordinator.StartEnrollment(caller, sinks.back(), MakeEnroll(0));
    }
    const int live = (h.coordinator.active(SessionKind::kEnroll) != nullptr ? 1 : 0) +
                     (h.coordinator.active(SessionKind::kAuthenticate) != nullptr ? 1 : 0);
    Require(live == 1, "enroll and authenticate never coexist");
  }
  for (std::size_t i = 0; i + 1 < sinks.size(); ++i) {
    Require(sinks[i]->CountErrors(SensorError::kCanceled) == 1, "each preempted session once");
  }
  Require(sinks.back()->records.empty(), "latest session untouched");
}

void TestLockedAuthenticationCreatesNoSession() {
  Harness h;
  for (int i = 0; i < 6; ++i) {
    h.lockout.RecordFailure();
  }
  auto sink = std::make_shared<RecordingSink>();
  h.coordinator.StartAuthentication(4, sink, MakeAuthenticate(10));
  Require(sink->records.size() == 1, "one notification");
  Require(sink->CountErrors(SensorError::kLockout) == 1, "lockout error delivered");
  Require(h.coordinator.active(SessionKind::kAuthenticate) == nullptr, "no session created");
  Require(h.driver().authenticate_calls == 0, "driver never asked to authenticate");
  Require(h.liveness.size() == 0, "no death registration left behind");
}

void TestRemoveIndependentOfOtherKinds() {
  Harness h;
  auto remove_sink = std::make_shared<RecordingSink>();
  h.coordinator.StartRemove(9, remove_sink, RemoveRequest{7, 10});
  Require(h.driver().remove_calls == 1 && h.driver().last_template == 7, "driver remove");

  h.coordinator.StartEnrollment(1, std::make_shared<RecordingSink>(), MakeEnroll(10));
  h.coordinator.StartAuthentication(2, std::make_shared<RecordingSink>(), MakeAuthenticate(10));
  h.coordinator.Cancel(SessionKind::kAuthenticate, 2);
  h.coordinator.StopPendingOperations();
  Require(h.coordinator.active(SessionKind::kRemove) != nullptr, "remove survives traffic");
  Require(remove_sink->records.empty(), "remove sink untouched");

  auto replacement = std::make_shared<RecordingSink>();
  h.coordinator.StartRemove(11, replacement, RemoveRequest{0, 10});
  Require(remove_sink->CountErrors(SensorError::kCanceled) == 1, "replaced remove canceled");
  Require(h.coordinator.active(SessionKind::kRemove)->caller() == 11, "replacement slotted");
  Require(!h.liveness.IsRegistered(9), "replaced caller unlinked");
}

void TestCancelRequiresOwner() {
  Harness h;
  auto sink = std::make_shared<RecordingSink>();
  h.coordinator.StartEnrollment(1, sink, MakeEnroll(10));

  h.coordinator.Cancel(SessionKind::kEnroll, 2);
  Require(!h.coordinator.StopEnrollment(2, true), "stranger cannot stop");
  Require(h.coordinator.active(SessionKind::kEnroll) != nullptr, "session untouched");
  Require(sink->records.empty() && h.driver().cancel_enroll_calls == 0, "silent no-op");

  h.coordinator.Cancel(SessionKind::kEnroll, 1);
  Require(h.coordinator.active(SessionKind::kEnroll) == nullptr, "owner cancels");
  Require(sink->CountErrors(SensorError::kCanceled) == 1, "owner notified");
  Require(h.driver().cancel_enroll_calls == 1, "driver canceled");

  auto remove_sink = std::make_shared<RecordingSink>();
  h.coordinator.StartRemove(5, remove_sink, RemoveRequest{3, 10});
  h.coordinator.Cancel(SessionKind::kRemove, 6);
  Require(h.coordinator.active(SessionKind::kRemove) != nullptr, "remove kept for stranger");
  h.coordinator.Cancel(SessionKind::kRemove, 5);
  Require(h.coordinator.active(SessionKind::kRemove) == nullptr, "remove canceled by owner");
  Require(remove_sink->CountErrors(SensorError::kCanceled) == 1, "remove owner notified");
}

void TestRejectedStartKeepsSessionByDefault() {
  Harness h;
  h.driver().enroll_status = -3;
  auto sink = std::make_shared<RecordingSink>();
  h.coordinator.StartEnrollment(1, sink, MakeEnroll(10));
  Require(h.coordinator.active(SessionKind::kEnroll) != nullptr, "rejected session kept");
  Require(sink->records.empty(), "no notification on rejection");
  Require(h.driver().enroll_calls == 1, "no retry");
}

void TestRejectedStartTearsDownWhenConfigured() {
  SessionCoordinator::Settings settings{};
  settings.teardown_on_driver_reject = true;
  Harness h(settings);
  h.driver().authenticate_status = -1;
  auto sink = std::make_shared<RecordingSink>();
  h.coordinator.StartAuthentication(1, sink, MakeAuthenticate(10));
  Require(h.coordinator.active(SessionKind::kAuthenticate) == nullptr, "rejected torn down");
  Require(sink->CountErrors(SensorError::kHwUnavailable) == 1, "caller told hardware failed");
  Require(h.liveness.size() == 0, "registration released");
}

void TestUnavailableDriverAbortsStart() {
  Harness h;
  auto enroll_sink = std::make_shared<RecordingSink>();
  h.coordinator.StartEnrollment(1, enroll_sink, MakeEnroll(10));

  h.driver().Die();
  h.queue.RunPending();
  h.registry->available = false;

  auto auth_sink = std::make_shared<RecordingSink>();
  h.coordinator.StartAuthentication(2, auth_sink, MakeAuthenticate(10));
  Require(h.coordinator.active(SessionKind::kAuthenticate) == nullptr, "no session created");
  Require(h.coordinator.active(SessionKind::kEnroll) != nullptr, "existing session untouched");
  Require(enroll_sink->records.empty(), "existing session not canceled");

  h.coordinator.Cancel(SessionKind::kEnroll, 1);
  Require(h.coordinator.active(SessionKind::kEnroll) != nullptr,
          "cancel short-circuits without a driver");
}

void TestCallerDeathTearsDownSilently() {
  Harness h;
  auto sink = std::make_shared<RecordingSink>();
  h.coordinator.StartAuthentication(4, sink, MakeAuthenticate(10));
  h.liveness.NotifyCallerDied(4);
  h.queue.RunPending();
  Require(h.coordinator.active(SessionKind::kAuthenticate) == nullptr, "session torn down");
  Require(sink->records.empty(), "no sink call on caller death");
  Require(h.liveness.size() == 0, "registration released");
}

void TestRemoveSessionIdempotent() {
  Harness h;
  h.coordinator.StartRemove(3, std::make_shared<RecordingSink>(), RemoveRequest{1, 10});
  auto* session = h.coordinator.active(SessionKind::kRemove);
  h.coordinator.RemoveSession(session);
  h.coordinator.RemoveSession(nullptr);
  Require(h.coordinator.active(SessionKind::kRemove) == nullptr, "cleared");
  Require(h.liveness.size() == 0, "released once");
}

}  // namespace

// Records how many callers are registered when the session is canceled.
class CancelObserver final : public ResultSink {
public:
  explicit CancelObserver(const LivenessRegistry& liveness) : liveness_(liveness) {}

  void OnEnrollResult(std::uint64_t, std::uint32_t, std::int32_t, std::int32_t) override {}
  void OnAcquired(std::uint64_t, std::int32_t) override {}
  void OnAuthenticated(std::uint64_t, std::uint32_t, std::int32_t) override {}
  void OnError(std::uint64_t, SensorError error) override {
    if (error == SensorError::kCanceled) {
      registered_at_cancel = static_cast<int>(liveness_.size());
    }
  }
  void OnRemoved(std::uint64_t, std::uint32_t, std::int32_t) override {}

  int registered_at_cancel{-1};

private:
  const LivenessRegistry& liveness_;
};

void TestPreemptionTearsDownBeforeInsert() {
  Harness h;
  auto enroll = std::make_shared<CancelObserver>(h.liveness);
  h.coordinator.StartEnrollment(1, enroll, MakeEnroll(10));
  h.coordinator.StartEnrollment(2, std::make_shared<RecordingSink>(), MakeEnroll(10));
  Require(enroll->registered_at_cancel == 1, "enrollment replaced only after teardown");
  Require(h.liveness.size() == 1, "one enrollment registered");

  auto remove = std::make_shared<CancelObserver>(h.liveness);
  h.coordinator.StartRemove(3, remove, RemoveRequest{4, 10});
  Require(h.liveness.size() == 2, "enroll and remove registered");
  h.coordinator.StartRemove(3, std::make_shared<RecordingSink>(), RemoveRequest{5, 10});
  Require(remove->registered_at_cancel == 2, "removal replaced only after teardown");
  Require(h.liveness.size() == 2, "one removal registered");

  h.liveness.NotifyCallerDied(3);
  h.queue.RunPending();
  Require(h.coordinator.active(SessionKind::kRemove) == nullptr,
          "replacement removal tracks caller death");
}

int main() {
  fpc::test::DisableAuditLog();
  TestEnrollForwardsRequest();
  TestPreemptionCancelsExactlyOnce();
  TestPreemptionTearsDownBeforeInsert();
  TestRepeatedStartsKeepOneSessionPerKind();
  TestLockedAuthenticationCreatesNoSession();
  TestRemoveIndependentOfOtherKinds();
  TestCancelRequiresOwner();
  TestRejectedStartKeepsSessionByDefault();
  TestRejectedStartTearsDownWhenConfigured();
  TestUnavailableDriverAbortsStart();
  TestCallerDeathTearsDownSilently();
  TestRemoveSessionIdempotent();
  std::cout << "test_session_coordinator completed" << std::endl;
  return 0;
}
