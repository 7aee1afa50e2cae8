#pragma once

#include <filesystem>
#include <string_view>

#include "crypto/ec_key.hpp"
#include "util/argon2_kdf.hpp"

namespace sealnode::crypto {

// Server identity key at rest: Argon2id(passphrase, salt) keys a
// ChaCha20-Poly1305 box around the 32-byte scalar. The file is JSON so the KDF
// parameters travel with it.
void WriteKeyFile(const std::filesystem::path& path, const PrivateKey& key,
                  std::string_view passphrase,
                  const util::Argon2idParams& params = util::DefaultArgon2idParams());

// Throws Error(kNotFound) if absent, Error(kInvalidKey) on a wrong passphrase
// and Error(kStorage) on malformed files.
PrivateKey ReadKeyFile(const std::filesystem::path& path, std::string_view passphrase);

}  // namespace sealnode::crypto
