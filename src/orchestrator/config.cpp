#include "fpc/orchestrator/config.h"

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>

#include "fpc/error.h"
#include "fpc/errors.h"

namespace fpc::orchestrator {

namespace {

const char* ReadEnv(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

std::uint64_t ParseUnsigned(const char* name, const char* text, std::uint64_t min,
                            std::uint64_t max) {
  const auto length = std::strlen(text);
  std::uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(text, text + length, value);
  if (ec == std::errc::result_out_of_range) {
    throw Error{ErrorDomain::Config, errors::config::kOutOfRange,
                std::string(errors::msg::kConfigValueOutOfRange), std::nullopt,
                Retryability::kFatal, {name}};
  }
  if (ec != std::errc() || ptr != text + length) {
    throw Error{ErrorDomain::Config, errors::config::kInvalidValue,
                std::string(errors::msg::kInvalidConfigValue), std::nullopt,
                Retryability::kFatal, {name}};
  }
  if (value < min || value > max) {
    throw Error{ErrorDomain::Config, errors::config::kOutOfRange,
                std::string(errors::msg::kConfigValueOutOfRange), std::nullopt,
                Retryability::kFatal, {name}};
  }
  return value;
}

bool ParseFlag(const char* name, std::string_view text) {
  if (text == "1" || text == "true") {
    return true;
  }
  if (text == "0" || text == "false") {
    return false;
  }
  throw Error{ErrorDomain::Config, errors::config::kInvalidValue,
              std::string(errors::msg::kInvalidConfigValue), std::nullopt, Retryability::kFatal,
              {name}};
}

}  // namespace

CoordinatorConfig LoadConfigFromEnvironment(CoordinatorConfig base) {
  if (const char* env = ReadEnv("FPC_MAX_FAILED_ATTEMPTS")) {
    base.max_failed_attempts =
        static_cast<std::uint32_t>(ParseUnsigned("FPC_MAX_FAILED_ATTEMPTS", env, 1, 1000));
  }
  if (const char* env = ReadEnv("FPC_LOCKOUT_SECONDS")) {
    base.lockout_duration =
        std::chrono::seconds(ParseUnsigned("FPC_LOCKOUT_SECONDS", env, 1, 86400));
  }
  if (const char* env = ReadEnv("FPC_ENROLL_TIMEOUT_SECONDS")) {
    base.enroll_timeout =
        std::chrono::seconds(ParseUnsigned("FPC_ENROLL_TIMEOUT_SECONDS", env, 1, 3600));
  }
  if (const char* env = ReadEnv("FPC_TEARDOWN_ON_REJECT")) {
    base.teardown_on_driver_reject = ParseFlag("FPC_TEARDOWN_ON_REJECT", env);
  }
  if (const char* env = ReadEnv("FPC_DATA_ROOT")) {
    base.data_root = std::filesystem::path(env);
  }
  return base;
}

}  // namespace fpc::orchestrator
