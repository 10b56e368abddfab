#include "fakes.h"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

using fpc::test::Require;
using fpc::orchestrator::SerialQueue;

void TestRunsTasksInArrivalOrder() {
  fpc::test::FakeClock clock;
  SerialQueue queue(clock.source());
  std::vector<int> order;
  queue.Post([&]() { order.push_back(1); });
  queue.Post([&]() {
    order.push_back(2);
    queue.Post([&]() { order.push_back(4); });
  });
  queue.Post([&]() { order.push_back(3); });
  const auto executed = queue.RunPending();
  Require(executed == 4, "nested post must run in the same drain");
  Require(order == std::vector<int>({1, 2, 3, 4}), "tasks must run in arrival order");
}

void TestDelayedTasksWaitForDueTime() {
  fpc::test::FakeClock clock;
  SerialQueue queue(clock.source());
  std::vector<int> order;
  queue.PostDelayed([&]() { order.push_back(2); }, 20s);
  queue.PostDelayed([&]() { order.push_back(1); }, 10s);
  queue.RunPending();
  Require(order.empty(), "delayed tasks must not run early");
  clock.Advance(10s);
  queue.RunPending();
  Require(order == std::vector<int>({1}), "first delayed task due");
  clock.Advance(15s);
  queue.RunPending();
  Require(order == std::vector<int>({1, 2}), "second delayed task due");
  Require(queue.pending() == 0, "queue drained");
}

void TestCancelDropsDelayedTask() {
  fpc::test::FakeClock clock;
  SerialQueue queue(clock.source());
  int fired = 0;
  const auto id = queue.PostDelayed([&]() { ++fired; }, 5s);
  Require(id != 0, "delayed task id");
  Require(queue.Cancel(id), "first cancel succeeds");
  Require(!queue.Cancel(id), "second cancel is a no-op");
  clock.Advance(10s);
  queue.RunPending();
  Require(fired == 0, "canceled task must not run");
}

void TestFailingTaskDoesNotStopQueue() {
  fpc::test::FakeClock clock;
  SerialQueue queue(clock.source());
  int ran = 0;
  queue.Post([]() { throw std::runtime_error("boom"); });
  queue.Post([&]() { ++ran; });
  queue.RunPending();
  Require(ran == 1, "task after a failing task must still run");
}

void TestInvokeInlineInManualMode() {
  fpc::test::FakeClock clock;
  SerialQueue queue(clock.source());
  const int value = queue.Invoke([]() { return 42; });
  Require(value == 42, "inline invoke result");
}

void TestWorkerThread() {
  SerialQueue queue;
  queue.Start();
  Require(queue.running(), "worker running");
  const auto caller = std::this_thread::get_id();
  const bool on_queue = queue.Invoke([&]() {
    return queue.RunsTasksOnCurrentThread() && std::this_thread::get_id() != caller;
  });
  Require(on_queue, "invoke must execute on the worker thread");

  std::atomic<int> fired{0};
  queue.PostDelayed([&]() { fired.fetch_add(1); }, 20ms);
  for (int i = 0; i < 200 && fired.load() == 0; ++i) {
    std::this_thread::sleep_for(5ms);
  }
  Require(fired.load() == 1, "worker must run delayed tasks once due");

  bool threw = false;
  try {
    queue.Invoke([]() -> int {
      throw fpc::Error{fpc::ErrorDomain::Internal, 0x7F01, "failure inside task"};
    });
  } catch (const fpc::Error& err) {
    threw = err.code == 0x7F01;
  }
  Require(threw, "invoke must forward exceptions to the caller");

  queue.Stop();
  queue.Post([&]() { fired.fetch_add(1); });
  Require(queue.pending() == 0, "posts after stop are dropped");
}

}  // namespace

int main() {
  fpc::test::DisableAuditLog();
  TestRunsTasksInArrivalOrder();
  TestDelayedTasksWaitForDueTime();
  TestCancelDropsDelayedTask();
  TestFailingTaskDoesNotStopQueue();
  TestInvokeInlineInManualMode();
  TestWorkerThread();
  std::cout << "test_serial_queue completed" << std::endl;
  return 0;
}
