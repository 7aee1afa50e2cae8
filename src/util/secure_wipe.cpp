#include "util/secure_wipe.hpp"

#include <openssl/crypto.h>

namespace sealnode::util {

void SecureWipe(void* data, std::size_t size) noexcept {
  if (data == nullptr || size == 0) {
    return;
  }
  OPENSSL_cleanse(data, size);
}

}  // namespace sealnode::util
