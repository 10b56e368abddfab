#include "fpc/crypto/random.h"

#include "fpc/crypto/provider.h"

namespace fpc::crypto {

void SystemRandomBytes(std::span<uint8_t> out) {
  GetCryptoProviderShared()->RandomBytes(out);
}

}  // namespace fpc::crypto
