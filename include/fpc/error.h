#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fpc {
  enum class ErrorDomain : std::uint16_t {
    Security = 0x01,
    Config = 0x05,
    Driver = 0x06,
    Session = 0x07,
    State = 0x08,
    Internal = 0x7F
  };

  // Each domain reserves 0x100 codes so they never collide with propagated driver status
  // values. Codes inside the reserved range are stable across releases.
  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Security:
      return 0x0100;
    case ErrorDomain::Config:
      return 0x0500;
    case ErrorDomain::Driver:
      return 0x0600;
    case ErrorDomain::Session:
      return 0x0700;
    case ErrorDomain::State:
      return 0x0800;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0; // unreachable but placates compilers without warnings enabled
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace security {
      inline constexpr int kPermissionDenied = Make(ErrorDomain::Security, 0x01);
    } // namespace security

    namespace config {
      inline constexpr int kInvalidValue = Make(ErrorDomain::Config, 0x01);
      inline constexpr int kOutOfRange = Make(ErrorDomain::Config, 0x02);
    } // namespace config

    namespace driver {
      inline constexpr int kTransportFailed = Make(ErrorDomain::Driver, 0x01);
      inline constexpr int kDeathLinkFailed = Make(ErrorDomain::Driver, 0x02);
    } // namespace driver

    namespace session {
      inline constexpr int kSinkUnreachable = Make(ErrorDomain::Session, 0x01);
      inline constexpr int kInvalidCaller = Make(ErrorDomain::Session, 0x02);
    } // namespace session

    namespace state {
      inline constexpr int kQueueStopped = Make(ErrorDomain::State, 0x01);
    } // namespace state

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };
} // namespace fpc
