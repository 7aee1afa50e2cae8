#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace sealnode::util {

struct Argon2idParams {
  std::uint32_t t_cost{3};           // passes
  std::uint32_t m_cost_kib{64 * 1024};
  std::uint32_t parallelism{1};
};

using DerivedKey = std::array<std::uint8_t, 32>;

// Used for the identity key file; stored next to the ciphertext so stronger
// settings can be introduced without breaking old files.
Argon2idParams DefaultArgon2idParams();

bool DeriveKeyArgon2id(std::string_view passphrase, std::span<const std::uint8_t> salt,
                       const Argon2idParams& params, DerivedKey* key_out,
                       std::string* error = nullptr);

}  // namespace sealnode::util
