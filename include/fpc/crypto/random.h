#pragma once

#include <cstdint>
#include <span>

namespace fpc::crypto {

void SystemRandomBytes(std::span<uint8_t> out);

}  // namespace fpc::crypto
