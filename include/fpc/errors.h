#pragma once

#include <string_view>

namespace fpc::errors::msg {
// Centralized message catalog
inline constexpr std::string_view kPermissionDenied{"Caller lacks the required permission"};
inline constexpr std::string_view kSensorUseDenied{"Caller is not allowed to use the fingerprint sensor"};
inline constexpr std::string_view kDriverUnavailable{"Fingerprint driver not available"};
inline constexpr std::string_view kDriverDied{"Fingerprint driver died"};
inline constexpr std::string_view kDriverTransportFailed{"Fingerprint driver call failed"};
inline constexpr std::string_view kDriverRejected{"Fingerprint driver rejected request"};
inline constexpr std::string_view kDeathLinkFailed{"Failed to register for driver death notification"};
inline constexpr std::string_view kSinkUnreachable{"Failed to deliver result to caller"};
inline constexpr std::string_view kLockoutActive{"In lockout mode; disallowing authentication"};
inline constexpr std::string_view kLockoutDeliveryFailed{"Cannot send lockout message to client"};
inline constexpr std::string_view kLockoutReset{"Reset fingerprint lockout"};
inline constexpr std::string_view kEnumerateLengthMismatch{"Template ids and subjects differ in length"};
inline constexpr std::string_view kStorageDirectoryFailed{"Cannot create template storage directory"};
inline constexpr std::string_view kInvalidConfigValue{"Invalid configuration value"};
inline constexpr std::string_view kConfigValueOutOfRange{"Configuration value out of range"};
inline constexpr std::string_view kQueueStopped{"Serial queue is not accepting work"};
inline constexpr std::string_view kInvalidCaller{"Caller token must be non-zero"};
}  // namespace fpc::errors::msg
