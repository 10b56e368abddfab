#include "fpc/crypto/sha256.h"

#include "fpc/crypto/provider.h"

namespace fpc::crypto {

std::array<uint8_t, 32> SHA256_Hash(std::span<const uint8_t> data) {
  auto provider = GetCryptoProviderShared();
  return provider->SHA256(data);
}

}  // namespace fpc::crypto
