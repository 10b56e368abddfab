#include "fpc/orchestrator/serial_queue.h"

#include <exception>
#include <iostream>
#include <string>

#include "fpc/orchestrator/event_bus.h"

namespace fpc::orchestrator {

namespace {

void PublishTaskFailure(std::string_view what, std::string message) {
  Event event{};
  event.category = EventCategory::kDiagnostics;
  event.severity = EventSeverity::kError;
  event.event_id = "serial_queue_task_failed";
  event.message = std::move(message);
  event.fields.emplace_back("exception", std::string(what));
  EventBus::Instance().Publish(event);
}

}  // namespace

SerialQueue::SerialQueue() : SerialQueue(NowSource{}) {}

SerialQueue::SerialQueue(NowSource now) : now_(std::move(now)) {
  if (!now_) {
    now_ = []() { return Clock::now(); };
  }
}

SerialQueue::~SerialQueue() { Stop(); }

void SerialQueue::Post(Task task) {
  if (!task) {
    return;
  }
  {
    std::lock_guard<std::mutex> guard(mutex_);
    if (stopping_) {
      return;
    }
    ready_.push_back(std::move(task));
  }
  cv_.notify_one();
}

SerialQueue::TaskId SerialQueue::PostDelayed(Task task, Duration delay) {
  TaskId id = 0;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    if (stopping_ || !task) {
      return 0;
    }
    id = next_id_++;
    const auto due = now_() + (delay < Duration::zero() ? Duration::zero() : delay);
    delayed_.emplace(std::make_pair(due, id), std::move(task));
    delayed_index_.emplace(id, due);
  }
  cv_.notify_one();
  return id;
}

bool SerialQueue::Cancel(TaskId id) noexcept {
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = delayed_index_.find(id);
  if (it == delayed_index_.end()) {
    return false;
  }
  delayed_.erase(std::make_pair(it->second, id));
  delayed_index_.erase(it);
  return true;
}

void SerialQueue::Start() {
  std::lock_guard<std::mutex> guard(mutex_);
  if (started_ || stopping_) {
    return;
  }
  started_ = true;
  worker_ = std::thread([this]() { WorkerLoop(); });
}

void SerialQueue::Stop() {
  {
    std::lock_guard<std::mutex> guard(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
    worker_.join();
  }
  std::deque<Task> dropped_ready;
  std::map<std::pair<TimePoint, TaskId>, Task> dropped_delayed;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    dropped_ready.swap(ready_);
    dropped_delayed.swap(delayed_);
    delayed_index_.clear();
  }
}

void SerialQueue::PromoteDueLocked(TimePoint now) {
  while (!delayed_.empty()) {
    auto it = delayed_.begin();
    if (it->first.first > now) {
      break;
    }
    delayed_index_.erase(it->first.second);
    ready_.push_back(std::move(it->second));
    delayed_.erase(it);
  }
}

std::optional<SerialQueue::Task> SerialQueue::PopReadyLocked(TimePoint now) {
  PromoteDueLocked(now);
  if (ready_.empty()) {
    return std::nullopt;
  }
  Task task = std::move(ready_.front());
  ready_.pop_front();
  return task;
}

void SerialQueue::RunTask(Task& task) noexcept {
  try {
    task();
  } catch (const fpc::Error& err) {
    PublishTaskFailure("fpc::Error", err.what());
  } catch (const std::exception& ex) {
    PublishTaskFailure("std::exception", ex.what());
  }
}

std::size_t SerialQueue::RunPending() {
  std::size_t executed = 0;
  for (;;) {
    std::optional<Task> task;
    {
      std::lock_guard<std::mutex> guard(mutex_);
      if (stopping_) {
        break;
      }
      task = PopReadyLocked(now_());
      if (!task) {
        break;
      }
      executing_thread_ = std::this_thread::get_id();
    }
    RunTask(*task);
    ++executed;
    std::lock_guard<std::mutex> guard(mutex_);
    executing_thread_ = std::thread::id{};
  }
  return executed;
}

void SerialQueue::WorkerLoop() {
  std::unique_lock<std::mutex> lock(mutex_);
  executing_thread_ = std::this_thread::get_id();
  for (;;) {
    if (stopping_) {
      break;
    }
    auto task = PopReadyLocked(now_());
    if (task) {
      lock.unlock();
      RunTask(*task);
      lock.lock();
      continue;
    }
    if (delayed_.empty()) {
      cv_.wait(lock, [this]() { return stopping_ || !ready_.empty() || !delayed_.empty(); });
    } else {
      const auto remaining = delayed_.begin()->first.first - now_();
      cv_.wait_for(lock, remaining);
    }
  }
  executing_thread_ = std::thread::id{};
}

bool SerialQueue::RunsTasksOnCurrentThread() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return executing_thread_ == std::this_thread::get_id();
}

bool SerialQueue::running() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return started_ && !stopping_;
}

std::size_t SerialQueue::pending() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return ready_.size() + delayed_.size();
}

SerialQueue::TimePoint SerialQueue::Now() const { return now_(); }

}  // namespace fpc::orchestrator
