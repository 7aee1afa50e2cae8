#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace sealnode::util {

constexpr std::size_t kChaCha20Poly1305KeySize = 32;
constexpr std::size_t kChaCha20Poly1305NonceSize = 12;
constexpr std::size_t kChaCha20Poly1305TagSize = 16;

// RFC 8439 AEAD. Output is ciphertext || tag. Throws std::invalid_argument on
// bad key/nonce sizes and std::runtime_error if the cipher backend fails.
std::vector<std::uint8_t> ChaCha20Poly1305Encrypt(std::span<const std::uint8_t> key,
                                                  std::span<const std::uint8_t> nonce,
                                                  std::span<const std::uint8_t> aad,
                                                  std::span<const std::uint8_t> plaintext);
// Returns false on authentication failure.
bool ChaCha20Poly1305Decrypt(std::span<const std::uint8_t> key,
                             std::span<const std::uint8_t> nonce,
                             std::span<const std::uint8_t> aad,
                             std::span<const std::uint8_t> ciphertext,
                             std::vector<std::uint8_t>* plaintext);

}  // namespace sealnode::util
