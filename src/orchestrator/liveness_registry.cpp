#include "fpc/orchestrator/liveness_registry.h"

#include <string>
#include <utility>
#include <vector>

#include "fpc/error.h"
#include "fpc/errors.h"
#include "fpc/orchestrator/event_bus.h"
#include "fpc/orchestrator/serial_queue.h"

namespace fpc::orchestrator {

LivenessRegistry::Registration::Registration(LivenessRegistry* registry, std::uint64_t id,
                                             CallerToken caller) noexcept
    : registry_(registry), id_(id), caller_(caller) {}

LivenessRegistry::Registration::Registration(Registration&& other) noexcept
    : registry_(std::exchange(other.registry_, nullptr)),
      id_(std::exchange(other.id_, 0)),
      caller_(std::exchange(other.caller_, 0)) {}

LivenessRegistry::Registration&
LivenessRegistry::Registration::operator=(Registration&& other) noexcept {
  if (this != &other) {
    Release();
    registry_ = std::exchange(other.registry_, nullptr);
    id_ = std::exchange(other.id_, 0);
    caller_ = std::exchange(other.caller_, 0);
  }
  return *this;
}

LivenessRegistry::Registration::~Registration() { Release(); }

void LivenessRegistry::Registration::Release() noexcept {
  if (registry_ == nullptr) {
    return;
  }
  registry_->Unregister(id_);
  registry_ = nullptr;
  id_ = 0;
}

LivenessRegistry::LivenessRegistry(SerialQueue& queue) : queue_(queue) {}

LivenessRegistry::Registration LivenessRegistry::Register(CallerToken caller,
                                                          DeathCallback on_death) {
  if (caller == 0) {
    throw Error{ErrorDomain::Session, errors::session::kInvalidCaller,
                std::string(errors::msg::kInvalidCaller)};
  }
  const auto id = next_id_++;
  entries_.emplace(id, Entry{caller, std::move(on_death)});
  return Registration{this, id, caller};
}

void LivenessRegistry::Unregister(std::uint64_t id) noexcept { entries_.erase(id); }

void LivenessRegistry::NotifyCallerDied(CallerToken caller) {
  queue_.Post([this, caller]() { HandleCallerDied(caller); });
}

void LivenessRegistry::HandleCallerDied(CallerToken caller) {
  std::vector<std::uint64_t> matching;
  for (const auto& [id, entry] : entries_) {
    if (entry.caller == caller) {
      matching.push_back(id);
    }
  }
  if (matching.empty()) {
    return;
  }

  Event event{};
  event.category = EventCategory::kLifecycle;
  event.severity = EventSeverity::kInfo;
  event.event_id = "caller_died";
  event.message = "Caller died; tearing down its sessions";
  event.fields.emplace_back("caller", std::to_string(caller), FieldPrivacy::kHash);
  event.fields.emplace_back("sessions", std::to_string(matching.size()), FieldPrivacy::kPublic,
                            true);
  EventBus::Instance().Publish(event);

  // A callback may release other registrations, so look each one up again.
  for (auto id : matching) {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
      continue;
    }
    auto callback = it->second.on_death;
    if (callback) {
      callback();
    }
  }
}

bool LivenessRegistry::IsRegistered(CallerToken caller) const {
  for (const auto& [id, entry] : entries_) {
    if (entry.caller == caller) {
      return true;
    }
  }
  return false;
}

}  // namespace fpc::orchestrator
