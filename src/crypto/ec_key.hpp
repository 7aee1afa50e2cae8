#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "crypto/hash.hpp"

namespace sealnode::crypto {

constexpr std::size_t kPrivateKeySize = 32;
constexpr std::size_t kCompressedPublicKeySize = 33;
constexpr std::size_t kUncompressedPublicKeySize = 65;

using SharedSecret = std::array<std::uint8_t, 32>;

// A point on secp256k1, kept in compressed SEC1 form.
class PublicKey {
 public:
  // Accepts compressed (33 byte) or uncompressed (65 byte) SEC1 encodings.
  // Throws sealnode::Error(kInvalidKey) if the bytes are not a curve point.
  static PublicKey FromBytes(std::span<const std::uint8_t> encoded);
  static PublicKey FromHex(std::string_view hex);

  const std::array<std::uint8_t, kCompressedPublicKeySize>& Compressed() const noexcept {
    return compressed_;
  }
  std::array<std::uint8_t, 32> XOnly() const noexcept;
  std::string ToHex() const;

  bool operator==(const PublicKey& other) const = default;

 private:
  friend class PrivateKey;
  std::array<std::uint8_t, kCompressedPublicKeySize> compressed_{};
};

class PrivateKey {
 public:
  // Throws sealnode::Error(kInvalidKey) unless 0 < scalar < n.
  static PrivateKey FromBytes(std::span<const std::uint8_t> secret);
  static PrivateKey FromHex(std::string_view hex);
  static PrivateKey Generate();

  PrivateKey(const PrivateKey&) = default;
  PrivateKey& operator=(const PrivateKey&) = default;
  ~PrivateKey();

  PublicKey Public() const;
  std::span<const std::uint8_t> Secret() const noexcept { return secret_; }

  // DER encoded, low-S normalized ECDSA signature over a 32-byte digest.
  std::vector<std::uint8_t> Sign(const Hash256& digest) const;

 private:
  PrivateKey() = default;
  std::array<std::uint8_t, kPrivateKeySize> secret_{};
};

bool VerifySignature(const PublicKey& key, const Hash256& digest,
                     std::span<const std::uint8_t> der_signature);

// ECDH: SHA256 over the compressed shared point. Symmetric in the two key
// pairs and compatible with libsecp256k1's default ECDH hash.
SharedSecret DeriveSharedSecret(const PrivateKey& private_key, const PublicKey& public_key);

}  // namespace sealnode::crypto
