#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "crypto/ec_key.hpp"

namespace sealnode::identity {

struct Credentials {
  crypto::PrivateKey key;
  std::string public_key;  // compressed hex; the identity's ledger key
};

// Supplies the signing key for an operation. Keys are never read from the
// process environment by the core.
class CredentialProvider {
 public:
  virtual ~CredentialProvider() = default;
  // Throws Error(kInvalidKey) when no usable key is available.
  virtual Credentials Acquire() const = 0;
};

// Key carried by one request (bearer token); lives only as long as the
// request.
class RequestCredentials final : public CredentialProvider {
 public:
  // Throws Error(kInvalidKey) if `bearer` is not a 32-byte hex scalar.
  explicit RequestCredentials(std::string_view bearer);

  Credentials Acquire() const override;

 private:
  crypto::PrivateKey key_;
};

// The daemon's own identity, decrypted once from its key file.
class KeyFileCredentials final : public CredentialProvider {
 public:
  explicit KeyFileCredentials(crypto::PrivateKey key) : key_(std::move(key)) {}

  // Loads `path`; with `create_if_missing` a fresh key is generated and
  // written first.
  static KeyFileCredentials Load(const std::filesystem::path& path, std::string_view passphrase,
                                 bool create_if_missing);

  Credentials Acquire() const override;

 private:
  crypto::PrivateKey key_;
};

}  // namespace sealnode::identity
