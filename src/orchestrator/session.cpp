#include "fpc/orchestrator/session.h"

#include <exception>
#include <string>
#include <utility>

#include "fpc/error.h"
#include "fpc/errors.h"
#include "fpc/orchestrator/event_bus.h"

namespace fpc::orchestrator {

namespace {

void PublishDeliveryFailure(SessionKind kind, CallerToken caller, std::string_view what,
                            std::string_view reason) {
  Event event{};
  event.category = EventCategory::kDiagnostics;
  event.severity = EventSeverity::kWarning;
  event.event_id = "session_delivery_failed";
  event.message = std::string(errors::msg::kSinkUnreachable);
  event.fields.emplace_back("kind", std::string(SessionKindName(kind)));
  event.fields.emplace_back("callback", std::string(what));
  event.fields.emplace_back("caller", std::to_string(caller), FieldPrivacy::kHash);
  event.fields.emplace_back("reason", std::string(reason));
  EventBus::Instance().Publish(event);
}

}  // namespace

std::string_view SessionKindName(SessionKind kind) noexcept {
  switch (kind) {
  case SessionKind::kEnroll:
    return "enroll";
  case SessionKind::kAuthenticate:
    return "authenticate";
  case SessionKind::kRemove:
    return "remove";
  }
  return "unknown";
}

ClientSession::ClientSession(SessionKind kind, CallerToken caller,
                             std::shared_ptr<ResultSink> sink, std::int32_t subject,
                             LivenessRegistry::Registration liveness)
    : kind_(kind),
      caller_(caller),
      sink_(std::move(sink)),
      subject_(subject),
      liveness_(std::move(liveness)) {}

// Returns false when the sink is absent or the callback failed.
template <class Deliver>
bool ClientSession::TryDeliver(std::string_view what, Deliver&& deliver) {
  if (!sink_) {
    return false;
  }
  try {
    deliver(*sink_);
    return true;
  } catch (const Error& err) {
    PublishDeliveryFailure(kind_, caller_, what, err.what());
  } catch (const std::exception& ex) {
    PublishDeliveryFailure(kind_, caller_, what, ex.what());
  }
  return false;
}

SessionOutcome ClientSession::SendEnrollResult(std::uint64_t device_id,
                                               std::uint32_t template_id,
                                               std::int32_t subject, std::int32_t remaining) {
  const bool delivered = TryDeliver("enroll_result", [&](ResultSink& sink) {
    sink.OnEnrollResult(device_id, template_id, subject, remaining);
  });
  if (!delivered) {
    return SessionOutcome::kDone;
  }
  return remaining == 0 ? SessionOutcome::kDone : SessionOutcome::kContinuing;
}

SessionOutcome ClientSession::SendAcquired(std::uint64_t device_id, std::int32_t acquired_info) {
  const bool delivered = TryDeliver(
      "acquired", [&](ResultSink& sink) { sink.OnAcquired(device_id, acquired_info); });
  return delivered ? SessionOutcome::kContinuing : SessionOutcome::kDone;
}

SessionOutcome ClientSession::SendAuthenticated(std::uint64_t device_id,
                                                std::uint32_t template_id,
                                                std::int32_t subject) {
  TryDeliver("authenticated", [&](ResultSink& sink) {
    sink.OnAuthenticated(device_id, template_id, subject);
  });
  return SessionOutcome::kDone;
}

SessionOutcome ClientSession::SendError(std::uint64_t device_id, SensorError error) {
  TryDeliver("error", [&](ResultSink& sink) { sink.OnError(device_id, error); });
  return SessionOutcome::kDone;
}

SessionOutcome ClientSession::SendRemoved(std::uint64_t device_id, std::uint32_t template_id,
                                          std::int32_t subject) {
  const bool delivered = TryDeliver("removed", [&](ResultSink& sink) {
    sink.OnRemoved(device_id, template_id, subject);
  });
  if (!delivered) {
    return SessionOutcome::kDone;
  }
  return template_id == 0 ? SessionOutcome::kDone : SessionOutcome::kContinuing;
}

}  // namespace fpc::orchestrator
