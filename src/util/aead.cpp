#include "util/aead.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace sealnode::util {

namespace {

struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using UniqueCipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

void CheckSizes(std::span<const std::uint8_t> key, std::span<const std::uint8_t> nonce) {
  if (key.size() != kChaCha20Poly1305KeySize) {
    throw std::invalid_argument("ChaCha20-Poly1305 key must be 32 bytes");
  }
  if (nonce.size() != kChaCha20Poly1305NonceSize) {
    throw std::invalid_argument("ChaCha20-Poly1305 nonce must be 12 bytes");
  }
}

UniqueCipherCtx NewContext(std::span<const std::uint8_t> key,
                           std::span<const std::uint8_t> nonce, bool encrypt) {
  UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    throw std::runtime_error("EVP_CIPHER_CTX_new failed");
  }
  const int enc = encrypt ? 1 : 0;
  if (EVP_CipherInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr, enc) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN,
                          static_cast<int>(nonce.size()), nullptr) != 1 ||
      EVP_CipherInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data(), enc) != 1) {
    throw std::runtime_error("ChaCha20-Poly1305 init failed");
  }
  return ctx;
}

}  // namespace

std::vector<std::uint8_t> ChaCha20Poly1305Encrypt(std::span<const std::uint8_t> key,
                                                  std::span<const std::uint8_t> nonce,
                                                  std::span<const std::uint8_t> aad,
                                                  std::span<const std::uint8_t> plaintext) {
  CheckSizes(key, nonce);
  auto ctx = NewContext(key, nonce, /*encrypt=*/true);
  int len = 0;
  if (!aad.empty() &&
      EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
    throw std::runtime_error("ChaCha20-Poly1305 aad failed");
  }
  std::vector<std::uint8_t> out(plaintext.size() + kChaCha20Poly1305TagSize);
  int written = 0;
  if (!plaintext.empty()) {
    if (EVP_EncryptUpdate(ctx.get(), out.data(), &len, plaintext.data(),
                          static_cast<int>(plaintext.size())) != 1) {
      throw std::runtime_error("ChaCha20-Poly1305 encrypt failed");
    }
    written = len;
  }
  if (EVP_EncryptFinal_ex(ctx.get(), out.data() + written, &len) != 1) {
    throw std::runtime_error("ChaCha20-Poly1305 finalize failed");
  }
  written += len;
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG,
                          static_cast<int>(kChaCha20Poly1305TagSize), out.data() + written) != 1) {
    throw std::runtime_error("ChaCha20-Poly1305 tag failed");
  }
  out.resize(static_cast<std::size_t>(written) + kChaCha20Poly1305TagSize);
  return out;
}

bool ChaCha20Poly1305Decrypt(std::span<const std::uint8_t> key,
                             std::span<const std::uint8_t> nonce,
                             std::span<const std::uint8_t> aad,
                             std::span<const std::uint8_t> ciphertext,
                             std::vector<std::uint8_t>* plaintext) {
  CheckSizes(key, nonce);
  if (ciphertext.size() < kChaCha20Poly1305TagSize) {
    return false;
  }
  const std::size_t body_size = ciphertext.size() - kChaCha20Poly1305TagSize;
  auto ctx = NewContext(key, nonce, /*encrypt=*/false);
  int len = 0;
  if (!aad.empty() &&
      EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
    return false;
  }
  std::vector<std::uint8_t> out(body_size + 1);
  int written = 0;
  if (body_size > 0) {
    if (EVP_DecryptUpdate(ctx.get(), out.data(), &len, ciphertext.data(),
                          static_cast<int>(body_size)) != 1) {
      return false;
    }
    written = len;
  }
  std::uint8_t tag[kChaCha20Poly1305TagSize];
  std::copy(ciphertext.begin() + static_cast<std::ptrdiff_t>(body_size), ciphertext.end(), tag);
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG,
                          static_cast<int>(kChaCha20Poly1305TagSize), tag) != 1) {
    return false;
  }
  if (EVP_DecryptFinal_ex(ctx.get(), out.data() + written, &len) != 1) {
    return false;
  }
  written += len;
  out.resize(static_cast<std::size_t>(written));
  *plaintext = std::move(out);
  return true;
}

}  // namespace sealnode::util
