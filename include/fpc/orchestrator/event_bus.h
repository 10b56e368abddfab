#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <memory>
#include <mutex>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "fpc/crypto/hmac_sha256.h"
#include "fpc/crypto/sha256.h"

namespace fpc::orchestrator {

  // structured logging primitives
  enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

  enum class EventCategory { kTelemetry, kLifecycle, kSecurity, kDiagnostics };

  enum class FieldPrivacy { kPublic, kRedact, kHash };

  struct EventField {
    std::string key;
    std::string value;
    FieldPrivacy privacy{FieldPrivacy::kPublic};
    bool numeric{false};

    EventField(std::string k, std::string v, FieldPrivacy p = FieldPrivacy::kPublic,
               bool is_numeric = false)
        : key(std::move(k)), value(std::move(v)), privacy(p), numeric(is_numeric) {}
  };

  struct Event {
    EventCategory category{EventCategory::kDiagnostics};
    EventSeverity severity{EventSeverity::kInfo};
    std::string event_id;
    std::string message;
    std::vector<EventField> fields;
  };

  inline std::string HashForTelemetry(std::string_view input) {
    if (input.empty()) {
      return "";
    }
    const auto* data = reinterpret_cast<const uint8_t*>(input.data());
    auto digest = fpc::crypto::SHA256_Hash(std::span<const uint8_t>(data, input.size()));
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t byte : digest) {
      oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
  }

  // Serializes one event as a single JSON object without the integrity trailer.
  std::string FormatEventJson(const Event& event, const std::string& timestamp);

  class JsonLineLogger {
  public:
    JsonLineLogger();
    void Log(const Event& event);

    [[nodiscard]] bool enabled() const noexcept { return enabled_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return log_path_; }

  private:
    std::string FormatTimestamp(std::chrono::system_clock::time_point tp);
    void EnsureOpen();
    void RotateIfNeeded(size_t incoming_bytes);
    std::filesystem::path LogPath() const;
    size_t ResolveMaxBytes() const;

    std::mutex mutex_;
    std::ofstream stream_;
    std::filesystem::path log_path_;
    size_t max_bytes_;
    const size_t max_files_ = 3;
    bool enabled_{true};
    std::array<uint8_t, fpc::crypto::HMAC_SHA256::TAG_SIZE> hmac_key_{};
    std::array<uint8_t, fpc::crypto::HMAC_SHA256::TAG_SIZE> last_mac_{};
    uint64_t entry_counter_{0};
  };

  JsonLineLogger& DefaultJsonLogger();

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    static EventBus& Instance();

    void Publish(const Event& event);
    void Subscribe(Subscriber fn);

    EventBus();

  private:
    using SubscriberList = std::vector<Subscriber>;

    std::shared_ptr<const SubscriberList> subscribers_snapshot_;
    std::mutex subscribers_mutex_;
  };

  void ResetEventBusForTesting(); // test-only teardown, next Instance() starts with the default logger only

} // namespace fpc::orchestrator
