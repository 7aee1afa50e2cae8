#include "util/argon2_kdf.hpp"

#include <argon2.h>

namespace sealnode::util {

Argon2idParams DefaultArgon2idParams() { return Argon2idParams{}; }

bool DeriveKeyArgon2id(std::string_view passphrase, std::span<const std::uint8_t> salt,
                       const Argon2idParams& params, DerivedKey* key_out, std::string* error) {
  if (salt.size() < ARGON2_MIN_SALT_LENGTH) {
    if (error) {
      *error = "argon2 salt too short";
    }
    return false;
  }
  const int rc = argon2id_hash_raw(params.t_cost, params.m_cost_kib, params.parallelism,
                                   passphrase.data(), passphrase.size(), salt.data(), salt.size(),
                                   key_out->data(), key_out->size());
  if (rc != ARGON2_OK) {
    if (error) {
      *error = std::string("argon2id failed: ") + argon2_error_message(rc);
    }
    return false;
  }
  return true;
}

}  // namespace sealnode::util
