#include "fakes.h"

#include <memory>

namespace {

using fpc::test::Require;
using fpc::test::RecordingSink;
using namespace fpc::orchestrator;

void TestEnrollTerminalRules() {
  auto sink = std::make_shared<RecordingSink>();
  ClientSession session(SessionKind::kEnroll, 5, sink, 10);
  Require(session.SendAcquired(1, 0) == SessionOutcome::kContinuing, "acquired continues");
  Require(session.SendEnrollResult(1, 9, 10, 2) == SessionOutcome::kContinuing,
          "progress with samples remaining continues");
  Require(session.SendEnrollResult(1, 9, 10, 0) == SessionOutcome::kDone,
          "last sample finishes enrollment");
  Require(session.SendError(1, SensorError::kTimeout) == SessionOutcome::kDone,
          "errors always finish");
  Require(sink->records.size() == 4, "every notification delivered");
}

void TestAuthenticateAlwaysDone() {
  auto sink = std::make_shared<RecordingSink>();
  ClientSession session(SessionKind::kAuthenticate, 5, sink, 10);
  Require(session.SendAuthenticated(1, 0, 10) == SessionOutcome::kDone, "no match finishes");
  Require(session.SendAuthenticated(1, 3, 10) == SessionOutcome::kDone, "match finishes");
}

void TestRemoveSentinel() {
  auto sink = std::make_shared<RecordingSink>();
  ClientSession session(SessionKind::kRemove, 5, sink, 10);
  Require(session.SendRemoved(1, 7, 10) == SessionOutcome::kContinuing,
          "single removal keeps the session");
  Require(session.SendRemoved(1, 0, 10) == SessionOutcome::kDone, "sentinel finishes");
}

void TestDetachedSinkResolvesDone() {
  auto sink = std::make_shared<RecordingSink>();
  ClientSession session(SessionKind::kEnroll, 5, sink, 10);
  session.Detach();
  Require(!session.attached(), "detached");
  Require(session.SendAcquired(1, 0) == SessionOutcome::kDone, "absent sink is done");
  Require(session.SendEnrollResult(1, 9, 10, 3) == SessionOutcome::kDone, "absent sink is done");
  Require(sink->records.empty(), "no callbacks after detach");
}

void TestDeliveryFailureResolvesDone() {
  auto sink = std::make_shared<RecordingSink>();
  sink->unreachable = true;
  ClientSession session(SessionKind::kRemove, 5, sink, 10);
  Require(session.SendAcquired(1, 0) == SessionOutcome::kDone, "failed acquired is done");
  Require(session.SendRemoved(1, 7, 10) == SessionOutcome::kDone, "failed removal is done");
  Require(session.SendEnrollResult(1, 7, 10, 4) == SessionOutcome::kDone,
          "failed progress is done");
}

void TestLivenessReleasedExactlyOnce() {
  fpc::test::FakeClock clock;
  SerialQueue queue(clock.source());
  LivenessRegistry registry(queue);
  int deaths = 0;
  {
    ClientSession session(SessionKind::kAuthenticate, 8, nullptr, 0,
                          registry.Register(8, [&]() { ++deaths; }));
    Require(session.liveness_registered(), "registered while alive");
    Require(registry.IsRegistered(8), "registry knows the caller");
    session.ReleaseLiveness();
    session.ReleaseLiveness();
    Require(!session.liveness_registered(), "released");
    Require(registry.size() == 0, "released once");
  }
  registry.NotifyCallerDied(8);
  queue.RunPending();
  Require(deaths == 0, "released registration never fires");

  {
    auto registration = registry.Register(9, [&]() { ++deaths; });
    LivenessRegistry::Registration moved = std::move(registration);
    Require(!registration.active() && moved.active(), "registration moves");
    registry.NotifyCallerDied(9);
    queue.RunPending();
    Require(deaths == 1, "live registration fires");
  }
  Require(registry.size() == 0, "destructor unregisters");

  bool threw = false;
  try {
    auto bad = registry.Register(0, []() {});
  } catch (const fpc::Error& err) {
    threw = err.code == fpc::errors::session::kInvalidCaller;
  }
  Require(threw, "zero caller token rejected");
}

}  // namespace

int main() {
  fpc::test::DisableAuditLog();
  TestEnrollTerminalRules();
  TestAuthenticateAlwaysDone();
  TestRemoveSentinel();
  TestDetachedSinkResolvesDone();
  TestDeliveryFailureResolvesDone();
  TestLivenessReleasedExactlyOnce();
  std::cout << "test_session completed" << std::endl;
  return 0;
}
