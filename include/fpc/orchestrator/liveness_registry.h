#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>

namespace fpc::orchestrator {

class SerialQueue;

// Opaque identity of a remote caller. Zero never names a caller.
using CallerToken = std::uint64_t;

// Caller-death registration table. Owned by the serial queue thread; only
// NotifyCallerDied may be called from elsewhere.
class LivenessRegistry {
public:
  using DeathCallback = std::function<void()>;

  // Move-only handle. Destroying or releasing it unregisters exactly once.
  class Registration {
  public:
    Registration() = default;
    Registration(const Registration&) = delete;
    Registration& operator=(const Registration&) = delete;
    Registration(Registration&& other) noexcept;
    Registration& operator=(Registration&& other) noexcept;
    ~Registration();

    void Release() noexcept;

    [[nodiscard]] bool active() const noexcept { return registry_ != nullptr; }
    [[nodiscard]] CallerToken caller() const noexcept { return caller_; }
    explicit operator bool() const noexcept { return active(); }

  private:
    friend class LivenessRegistry;
    Registration(LivenessRegistry* registry, std::uint64_t id, CallerToken caller) noexcept;

    LivenessRegistry* registry_{nullptr};
    std::uint64_t id_{0};
    CallerToken caller_{0};
  };

  explicit LivenessRegistry(SerialQueue& queue);
  LivenessRegistry(const LivenessRegistry&) = delete;
  LivenessRegistry& operator=(const LivenessRegistry&) = delete;

  // Throws fpc::Error{Session, kInvalidCaller} for the zero token.
  [[nodiscard]] Registration Register(CallerToken caller, DeathCallback on_death);

  // Thread-safe. Posts the death handling onto the queue.
  void NotifyCallerDied(CallerToken caller);

  // Runs the callbacks of every registration still held by caller.
  void HandleCallerDied(CallerToken caller);

  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] bool IsRegistered(CallerToken caller) const;

private:
  struct Entry {
    CallerToken caller{0};
    DeathCallback on_death;
  };

  void Unregister(std::uint64_t id) noexcept;

  SerialQueue& queue_;
  std::map<std::uint64_t, Entry> entries_;
  std::uint64_t next_id_{1};
};

}  // namespace fpc::orchestrator
