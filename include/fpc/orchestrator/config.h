#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>

namespace fpc::orchestrator {

struct CoordinatorConfig {
  std::uint32_t max_failed_attempts{5};
  std::chrono::seconds lockout_duration{30};
  std::chrono::seconds enroll_timeout{60};
  bool teardown_on_driver_reject{false};
  std::filesystem::path data_root{"."};
};

// Overlays FPC_MAX_FAILED_ATTEMPTS, FPC_LOCKOUT_SECONDS, FPC_ENROLL_TIMEOUT_SECONDS,
// FPC_TEARDOWN_ON_REJECT and FPC_DATA_ROOT onto base. Throws fpc::Error in the Config domain.
CoordinatorConfig LoadConfigFromEnvironment(CoordinatorConfig base = {});

}  // namespace fpc::orchestrator
