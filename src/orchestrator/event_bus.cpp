#include "fpc/orchestrator/event_bus.h"

#include <algorithm>
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iostream>
#include <limits>
#include <new>
#include <optional>
#include <system_error>

#include "fpc/crypto/random.h"
#include "fpc/error.h"

namespace fpc::orchestrator {
namespace {

struct EventBusSingletonStorage { // manage singleton lifetime
  std::once_flag once;
  std::unique_ptr<EventBus> instance;

  void Reset() { // allow deterministic teardown
    instance.reset();
    this->~EventBusSingletonStorage();
    new (this) EventBusSingletonStorage();
  }
};

std::mutex& EventBusSingletonMutex() {
  static std::mutex mutex;
  return mutex;
}

EventBusSingletonStorage& EventBusSingleton() {
  static EventBusSingletonStorage storage;
  return storage;
}

struct PublishReentrancyGuard {  // suppress recursive publish deadlocks
  explicit PublishReentrancyGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~PublishReentrancyGuard() { flag_ = false; }
  PublishReentrancyGuard(const PublishReentrancyGuard&) = delete;
  PublishReentrancyGuard& operator=(const PublishReentrancyGuard&) = delete;

private:
  bool& flag_;
};

constexpr size_t kHmacSize = fpc::crypto::HMAC_SHA256::TAG_SIZE;
constexpr size_t kDefaultMaxBytes = 10 * 1024 * 1024;
constexpr size_t kHashTagChars = 16;
constexpr std::string_view kDefaultLogPath{"logs/fpcoord.log"};

std::string HashTag(std::string_view value) {
  std::string digest;
  try {
    digest = HashForTelemetry(value);
  } catch (const fpc::Error& err) {
    std::clog << "{\"event\":\"logger_error\",\"message\":\"field hash failed\",\"error_code\":"
              << err.code << "}" << std::endl;
    return "[UNHASHED]";
  }
  if (digest.size() > kHashTagChars) {
    digest.resize(kHashTagChars);
  }
  return digest;
}

std::string EscapeJson(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 8);
  for (unsigned char c : text) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c < 0x20) {
        char buffer[7];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<int>(c));
        out += buffer;
      } else {
        out.push_back(static_cast<char>(c));
      }
      break;
    }
  }
  return out;
}

const char* SeverityToString(EventSeverity severity) {
  switch (severity) {
  case EventSeverity::kDebug:
    return "debug";
  case EventSeverity::kInfo:
    return "info";
  case EventSeverity::kWarning:
    return "warning";
  case EventSeverity::kError:
    return "error";
  case EventSeverity::kCritical:
    return "critical";
  }
  return "info";
}

const char* CategoryToString(EventCategory category) {
  switch (category) {
  case EventCategory::kTelemetry:
    return "telemetry";
  case EventCategory::kLifecycle:
    return "lifecycle";
  case EventCategory::kSecurity:
    return "security";
  case EventCategory::kDiagnostics:
    return "diagnostics";
  }
  return "diagnostics";
}

std::string HexEncode(std::span<const uint8_t> bytes) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (uint8_t byte : bytes) {
    oss << std::setw(2) << static_cast<int>(byte);
  }
  return oss.str();
}

std::array<uint8_t, kHmacSize>
ComputeChainedMac(const std::array<uint8_t, kHmacSize>& key,
                  const std::array<uint8_t, kHmacSize>& previous, uint64_t sequence,
                  std::string_view canonical) {
  std::vector<uint8_t> buffer;
  buffer.reserve(previous.size() + sizeof(sequence) + canonical.size());
  buffer.insert(buffer.end(), previous.begin(), previous.end());
  for (int shift = 56; shift >= 0; shift -= 8) {
    buffer.push_back(static_cast<uint8_t>((sequence >> shift) & 0xFF));
  }
  const auto* canonical_bytes = reinterpret_cast<const uint8_t*>(canonical.data());
  buffer.insert(buffer.end(), canonical_bytes, canonical_bytes + canonical.size());
  return fpc::crypto::HMAC_SHA256::Compute(
      std::span<const uint8_t>(key.data(), key.size()),
      std::span<const uint8_t>(buffer.data(), buffer.size()));
}

bool LoggingDisabled(const char* value) {
  if (value == nullptr) {
    return false;
  }
  const std::string_view text{value};
  return text == "off" || text == "0" || text == "none";
}

} // namespace

std::string FormatEventJson(const Event& event, const std::string& timestamp) {
  std::string payload;
  payload.reserve(256);
  payload += "{\"ts\":\"";
  payload += EscapeJson(timestamp);
  payload += "\",\"severity\":\"";
  payload += SeverityToString(event.severity);
  payload += "\",\"category\":\"";
  payload += CategoryToString(event.category);
  payload += "\"";
  if (!event.event_id.empty()) {
    payload += ",\"event_id\":\"";
    payload += EscapeJson(event.event_id);
    payload += "\"";
  }
  if (!event.message.empty()) {
    payload += ",\"message\":\"";
    payload += EscapeJson(event.message);
    payload += "\"";
  }
  for (const auto& field : event.fields) {
    payload += ",\"";
    payload += EscapeJson(field.key);
    payload += "\":";
    std::string sanitized = field.value;
    if (field.privacy == FieldPrivacy::kRedact) {
      sanitized = "[REDACTED]"; // ensure sensitive data is masked
    } else if (field.privacy == FieldPrivacy::kHash) {
      sanitized = HashTag(field.value);
    }
    if (field.numeric && field.privacy == FieldPrivacy::kPublic) {
      payload += sanitized;
    } else {
      payload += "\"";
      payload += EscapeJson(sanitized);
      payload += "\"";
    }
  }
  payload += "}";
  return payload;
}

JsonLineLogger::JsonLineLogger()
    : log_path_(LogPath()),
      max_bytes_(ResolveMaxBytes()) {
  enabled_ = !log_path_.empty();
  last_mac_.fill(0);
  if (!enabled_) {
    return;
  }
  try {
    fpc::crypto::SystemRandomBytes(std::span<uint8_t>(hmac_key_.data(), hmac_key_.size()));
  } catch (const fpc::Error& err) {
    std::clog << "{\"event\":\"logger_error\",\"message\":\"audit key generation failed\",\"error_code\":"
              << err.code << "}" << std::endl;
    enabled_ = false;
  }
}

std::filesystem::path JsonLineLogger::LogPath() const {
  const char* env = std::getenv("FPC_AUDIT_LOG");
  if (LoggingDisabled(env)) {
    return {};
  }
  if (env != nullptr && *env != '\0') {
    return std::filesystem::path(env);
  }
  return std::filesystem::path(std::string(kDefaultLogPath));
}

std::string JsonLineLogger::FormatTimestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  auto fractional = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) %
                    std::chrono::seconds(1);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setw(6) << std::setfill('0') << fractional.count() << 'Z';
  return oss.str();
}

size_t JsonLineLogger::ResolveMaxBytes() const {
  const char* env = std::getenv("FPC_AUDIT_LOG_MAX_SIZE");
  if (!env || *env == '\0') {
    return kDefaultMaxBytes; // 10 MiB default
  }
  unsigned long long value = 0;
  auto [ptr, ec] = std::from_chars(env, env + std::strlen(env), value);
  if (ec != std::errc() || ptr != env + std::strlen(env) || value == 0) {
    return kDefaultMaxBytes;
  }
  return static_cast<size_t>(std::min<unsigned long long>(value, std::numeric_limits<size_t>::max()));
}

void JsonLineLogger::EnsureOpen() {
  if (stream_.is_open()) {
    return;
  }
  std::error_code ec;
  auto parent = log_path_.parent_path();
  if (!parent.empty()) {
    const bool parent_exists = std::filesystem::exists(parent, ec);
    if (ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"audit log directory stat failed\",\"error_code\":"
                << ec.value() << "}" << std::endl;
      return;
    }
    if (!parent_exists) {
      std::filesystem::create_directories(parent, ec);
      if (ec) {
        std::clog << "{\"event\":\"logger_error\",\"message\":\"audit log directory create failed\",\"error_code\":"
                  << ec.value() << "}" << std::endl;
        return;
      }
    }
  }
  stream_.open(log_path_, std::ios::out | std::ios::app);
}

void JsonLineLogger::RotateIfNeeded(size_t incoming_bytes) {
  std::error_code ec;
  const auto current = std::filesystem::exists(log_path_, ec) ? std::filesystem::file_size(log_path_, ec) : 0;
  if (ec || current + incoming_bytes <= max_bytes_) {
    return;
  }
  stream_.close();
  for (size_t index = max_files_ - 1; index >= 1; --index) {
    auto from = log_path_;
    from += "." + std::to_string(index);
    auto to = log_path_;
    to += "." + std::to_string(index + 1);
    std::error_code rename_ec;
    if (std::filesystem::exists(from, rename_ec)) {
      std::filesystem::rename(from, to, rename_ec);
      if (rename_ec) {
        std::clog << "{\"event\":\"logger_error\",\"message\":\"audit log rotation failed\",\"error_code\":"
                  << rename_ec.value() << "}" << std::endl;
      }
    }
  }
  auto first = log_path_;
  first += ".1";
  std::filesystem::rename(log_path_, first, ec);
  if (ec) {
    std::clog << "{\"event\":\"logger_error\",\"message\":\"audit log rotation failed\",\"error_code\":"
              << ec.value() << "}" << std::endl;
  }
  // a rotated file starts a fresh chain
  last_mac_.fill(0);
  entry_counter_ = 0;
}

void JsonLineLogger::Log(const Event& event) {
  if (!enabled_) {
    return;
  }
  auto canonical = FormatEventJson(event, FormatTimestamp(std::chrono::system_clock::now()));
  std::lock_guard<std::mutex> guard(mutex_);
  const uint64_t sequence = entry_counter_ + 1;
  std::array<uint8_t, kHmacSize> mac{};
  try {
    mac = ComputeChainedMac(hmac_key_, last_mac_, sequence, canonical);
  } catch (const fpc::Error& err) {
    std::clog << "{\"event\":\"logger_error\",\"message\":\"audit mac failed\",\"error_code\":"
              << err.code << "}" << std::endl;
    return;
  }
  canonical.pop_back();
  canonical += ",\"seq\":" + std::to_string(sequence) + ",\"mac\":\"" +
               HexEncode(std::span<const uint8_t>(mac.data(), mac.size())) + "\"}";
  RotateIfNeeded(canonical.size() + 1);
  EnsureOpen();
  if (!stream_.is_open()) {
    return;
  }
  stream_ << canonical << '\n';
  stream_.flush();
  if (!stream_) {
    std::clog << "{\"event\":\"logger_error\",\"message\":\"audit log write failed\"}" << std::endl;
    stream_.close();
    return;
  }
  last_mac_ = mac;
  entry_counter_ = sequence;
}

JsonLineLogger& DefaultJsonLogger() {
  static JsonLineLogger logger;
  return logger;
}

EventBus::EventBus() {
  auto initial = std::make_shared<SubscriberList>();
  initial->push_back([](const Event& e) { DefaultJsonLogger().Log(e); });
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  std::atomic_store_explicit(&subscribers_snapshot_, std::const_pointer_cast<const SubscriberList>(initial),
                             std::memory_order_release);
}

EventBus& EventBus::Instance() {
  auto& storage = EventBusSingleton();
  {
    std::lock_guard<std::mutex> guard(EventBusSingletonMutex());
    std::call_once(storage.once, [&storage]() {
      storage.instance = std::make_unique<EventBus>(); // lazy init
    });
  }
  return *storage.instance;
}

void EventBus::Publish(const Event& event) {
  static thread_local bool in_publish = false;
  if (in_publish) {
    std::clog << "{\"event\":\"event_bus_reentrancy\",\"message\":\"recursive publish suppressed\"}"
              << std::endl;
    return;
  }
  PublishReentrancyGuard guard(in_publish);
  auto targets = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  if (targets) {
    for (const auto& subscriber : *targets) {
      if (subscriber) {
        subscriber(event);
      }
    }
  }
}

void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  auto current = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  auto updated = current ? std::make_shared<SubscriberList>(*current) : std::make_shared<SubscriberList>();
  updated->push_back(std::move(fn));
  std::atomic_store_explicit(&subscribers_snapshot_, std::const_pointer_cast<const SubscriberList>(updated),
                             std::memory_order_release);
}

void ResetEventBusForTesting() {
  auto& storage = EventBusSingleton();
  std::lock_guard<std::mutex> guard(EventBusSingletonMutex());
  storage.Reset();
}

} // namespace fpc::orchestrator
