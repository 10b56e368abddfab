#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include "fpc/error.h"
#include "fpc/errors.h"

namespace fpc::orchestrator {

// Single-consumer task queue. Every coordinator, dispatcher and lockout mutation runs
// on it, one task at a time, in arrival order. Delayed tasks are promoted into the
// ready list once due and keep due-time order among themselves.
class SerialQueue {
public:
  using Clock = std::chrono::steady_clock;
  using Duration = Clock::duration;
  using TimePoint = Clock::time_point;
  using Task = std::function<void()>;
  using TaskId = std::uint64_t;
  using NowSource = std::function<TimePoint()>;

  SerialQueue();
  explicit SerialQueue(NowSource now);
  ~SerialQueue();

  SerialQueue(const SerialQueue&) = delete;
  SerialQueue& operator=(const SerialQueue&) = delete;

  // Tasks posted after Stop() are dropped.
  void Post(Task task);
  TaskId PostDelayed(Task task, Duration delay);
  bool Cancel(TaskId id) noexcept;

  void Start();
  void Stop();

  // Manual mode: runs every task due at Now() on the calling thread, including tasks
  // those tasks post. Returns the number of tasks executed.
  std::size_t RunPending();

  [[nodiscard]] bool RunsTasksOnCurrentThread() const;
  [[nodiscard]] bool running() const;
  [[nodiscard]] std::size_t pending() const;
  [[nodiscard]] TimePoint Now() const;

  // Runs fn on the queue and waits for its result. Executes inline when already on the
  // queue or when no worker thread is running.
  template <class Fn>
  auto Invoke(Fn fn) -> decltype(fn()) {
    using Result = decltype(fn());
    if (RunsTasksOnCurrentThread() || !running()) {
      return fn();
    }
    auto promise = std::make_shared<std::promise<Result>>();
    auto future = promise->get_future();
    Post([promise, fn = std::move(fn)]() mutable {
      try {
        if constexpr (std::is_void_v<Result>) {
          fn();
          promise->set_value();
        } else {
          promise->set_value(fn());
        }
      } catch (const std::exception&) {
        promise->set_exception(std::current_exception());
      }
    });
    try {
      return future.get();
    } catch (const std::future_error&) {
      throw fpc::Error{fpc::ErrorDomain::State, fpc::errors::state::kQueueStopped,
                       std::string(fpc::errors::msg::kQueueStopped)};
    }
  }

private:
  std::optional<Task> PopReadyLocked(TimePoint now);
  void PromoteDueLocked(TimePoint now);
  void RunTask(Task& task) noexcept;
  void WorkerLoop();

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Task> ready_;
  std::map<std::pair<TimePoint, TaskId>, Task> delayed_;
  std::unordered_map<TaskId, TimePoint> delayed_index_;
  TaskId next_id_{1};
  std::thread worker_;
  std::thread::id executing_thread_{};
  bool stopping_{false};
  bool started_{false};
  NowSource now_;
};

}  // namespace fpc::orchestrator
