#include "crypto/ec_key.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>

#include "core/error.hpp"
#include "util/csprng.hpp"
#include "util/hex.hpp"
#include "util/secure_wipe.hpp"

namespace sealnode::crypto {

namespace {

struct BnDeleter {
  void operator()(BIGNUM* bn) const { BN_clear_free(bn); }
};
struct BnCtxDeleter {
  void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};
struct EcPointDeleter {
  void operator()(EC_POINT* point) const { EC_POINT_clear_free(point); }
};
struct EcKeyDeleter {
  void operator()(EC_KEY* key) const { EC_KEY_free(key); }
};
struct EcdsaSigDeleter {
  void operator()(ECDSA_SIG* sig) const { ECDSA_SIG_free(sig); }
};

using UniqueBn = std::unique_ptr<BIGNUM, BnDeleter>;
using UniqueBnCtx = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using UniqueEcPoint = std::unique_ptr<EC_POINT, EcPointDeleter>;
using UniqueEcKey = std::unique_ptr<EC_KEY, EcKeyDeleter>;
using UniqueEcdsaSig = std::unique_ptr<ECDSA_SIG, EcdsaSigDeleter>;

[[noreturn]] void CryptoFailure(const char* what) {
  throw std::runtime_error(std::string("secp256k1 backend failure: ") + what);
}

const EC_GROUP* Curve() {
  static const EC_GROUP* group = [] {
    EC_GROUP* g = EC_GROUP_new_by_curve_name(NID_secp256k1);
    if (g == nullptr) {
      CryptoFailure("EC_GROUP_new_by_curve_name");
    }
    return g;
  }();
  return group;
}

UniqueBn ScalarFromBytes(std::span<const std::uint8_t> bytes) {
  UniqueBn bn(BN_secure_new());
  if (!bn || BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), bn.get()) == nullptr) {
    CryptoFailure("BN_bin2bn");
  }
  BN_set_flags(bn.get(), BN_FLG_CONSTTIME);
  return bn;
}

UniqueEcPoint DecodePoint(std::span<const std::uint8_t> encoded, BN_CTX* ctx) {
  UniqueEcPoint point(EC_POINT_new(Curve()));
  if (!point) {
    CryptoFailure("EC_POINT_new");
  }
  if (EC_POINT_oct2point(Curve(), point.get(), encoded.data(), encoded.size(), ctx) != 1 ||
      EC_POINT_is_at_infinity(Curve(), point.get()) == 1 ||
      EC_POINT_is_on_curve(Curve(), point.get(), ctx) != 1) {
    return nullptr;
  }
  return point;
}

std::array<std::uint8_t, kCompressedPublicKeySize> EncodeCompressed(const EC_POINT* point,
                                                                    BN_CTX* ctx) {
  std::array<std::uint8_t, kCompressedPublicKeySize> out{};
  if (EC_POINT_point2oct(Curve(), point, POINT_CONVERSION_COMPRESSED, out.data(), out.size(),
                         ctx) != out.size()) {
    CryptoFailure("EC_POINT_point2oct");
  }
  return out;
}

UniqueEcKey MakeEcKey() {
  UniqueEcKey key(EC_KEY_new());
  if (!key || EC_KEY_set_group(key.get(), Curve()) != 1) {
    CryptoFailure("EC_KEY_new");
  }
  return key;
}

}  // namespace

PublicKey PublicKey::FromBytes(std::span<const std::uint8_t> encoded) {
  if (encoded.size() != kCompressedPublicKeySize && encoded.size() != kUncompressedPublicKeySize) {
    ThrowError(ErrorKind::kInvalidKey, "public key must be 33 or 65 bytes");
  }
  UniqueBnCtx ctx(BN_CTX_new());
  if (!ctx) {
    CryptoFailure("BN_CTX_new");
  }
  auto point = DecodePoint(encoded, ctx.get());
  if (!point) {
    ThrowError(ErrorKind::kInvalidKey, "public key is not a valid secp256k1 point");
  }
  PublicKey key;
  key.compressed_ = EncodeCompressed(point.get(), ctx.get());
  return key;
}

PublicKey PublicKey::FromHex(std::string_view hex) {
  std::vector<std::uint8_t> bytes;
  if (!util::HexDecode(hex, &bytes)) {
    ThrowError(ErrorKind::kInvalidKey, "public key is not hex");
  }
  return FromBytes(bytes);
}

std::array<std::uint8_t, 32> PublicKey::XOnly() const noexcept {
  std::array<std::uint8_t, 32> out{};
  std::copy(compressed_.begin() + 1, compressed_.end(), out.begin());
  return out;
}

std::string PublicKey::ToHex() const { return util::HexEncode(compressed_); }

PrivateKey PrivateKey::FromBytes(std::span<const std::uint8_t> secret) {
  if (secret.size() != kPrivateKeySize) {
    ThrowError(ErrorKind::kInvalidKey, "private key must be 32 bytes");
  }
  auto scalar = ScalarFromBytes(secret);
  if (BN_is_zero(scalar.get()) || BN_cmp(scalar.get(), EC_GROUP_get0_order(Curve())) >= 0) {
    ThrowError(ErrorKind::kInvalidKey, "private key out of range");
  }
  PrivateKey key;
  std::copy(secret.begin(), secret.end(), key.secret_.begin());
  return key;
}

PrivateKey PrivateKey::FromHex(std::string_view hex) {
  std::array<std::uint8_t, kPrivateKeySize> bytes{};
  if (!util::HexDecodeFixed(hex, bytes)) {
    ThrowError(ErrorKind::kInvalidKey, "private key must be 64 hex characters");
  }
  try {
    auto key = FromBytes(bytes);
    util::SecureWipe(bytes);
    return key;
  } catch (const Error&) {
    util::SecureWipe(bytes);
    throw;
  }
}

PrivateKey PrivateKey::Generate() {
  for (;;) {
    auto candidate = util::SecureRandomBytes(kPrivateKeySize);
    try {
      auto key = FromBytes(candidate);
      util::SecureWipe(candidate);
      return key;
    } catch (const Error&) {
      // Out-of-range scalars have probability ~2^-128; draw again.
      util::SecureWipe(candidate);
    }
  }
}

PrivateKey::~PrivateKey() { util::SecureWipe(secret_); }

PublicKey PrivateKey::Public() const {
  UniqueBnCtx ctx(BN_CTX_new());
  UniqueEcPoint point(EC_POINT_new(Curve()));
  if (!ctx || !point) {
    CryptoFailure("allocation");
  }
  auto scalar = ScalarFromBytes(secret_);
  if (EC_POINT_mul(Curve(), point.get(), scalar.get(), nullptr, nullptr, ctx.get()) != 1) {
    CryptoFailure("EC_POINT_mul");
  }
  PublicKey key;
  key.compressed_ = EncodeCompressed(point.get(), ctx.get());
  return key;
}

std::vector<std::uint8_t> PrivateKey::Sign(const Hash256& digest) const {
  auto ec_key = MakeEcKey();
  auto scalar = ScalarFromBytes(secret_);
  if (EC_KEY_set_private_key(ec_key.get(), scalar.get()) != 1) {
    CryptoFailure("EC_KEY_set_private_key");
  }
  UniqueEcdsaSig sig(ECDSA_do_sign(digest.data(), static_cast<int>(digest.size()), ec_key.get()));
  if (!sig) {
    ThrowError(ErrorKind::kSigning, "ECDSA signing failed");
  }

  // Normalize to low-S (BIP-62) so signatures are not malleable.
  const BIGNUM* r = nullptr;
  const BIGNUM* s = nullptr;
  ECDSA_SIG_get0(sig.get(), &r, &s);
  UniqueBn half_order(BN_dup(EC_GROUP_get0_order(Curve())));
  if (!half_order || BN_rshift1(half_order.get(), half_order.get()) != 1) {
    CryptoFailure("BN_rshift1");
  }
  if (BN_cmp(s, half_order.get()) > 0) {
    UniqueBn low_s(BN_new());
    UniqueBn r_copy(BN_dup(r));
    if (!low_s || !r_copy || BN_sub(low_s.get(), EC_GROUP_get0_order(Curve()), s) != 1 ||
        ECDSA_SIG_set0(sig.get(), r_copy.get(), low_s.get()) != 1) {
      CryptoFailure("ECDSA_SIG_set0");
    }
    r_copy.release();
    low_s.release();
  }

  const int der_len = i2d_ECDSA_SIG(sig.get(), nullptr);
  if (der_len <= 0) {
    CryptoFailure("i2d_ECDSA_SIG");
  }
  std::vector<std::uint8_t> der(static_cast<std::size_t>(der_len));
  unsigned char* cursor = der.data();
  if (i2d_ECDSA_SIG(sig.get(), &cursor) != der_len) {
    CryptoFailure("i2d_ECDSA_SIG");
  }
  return der;
}

bool VerifySignature(const PublicKey& key, const Hash256& digest,
                     std::span<const std::uint8_t> der_signature) {
  const unsigned char* cursor = der_signature.data();
  UniqueEcdsaSig sig(
      d2i_ECDSA_SIG(nullptr, &cursor, static_cast<long>(der_signature.size())));
  if (!sig || cursor != der_signature.data() + der_signature.size()) {
    return false;
  }
  UniqueBnCtx ctx(BN_CTX_new());
  if (!ctx) {
    CryptoFailure("BN_CTX_new");
  }
  auto point = DecodePoint(key.Compressed(), ctx.get());
  if (!point) {
    return false;
  }
  auto ec_key = MakeEcKey();
  if (EC_KEY_set_public_key(ec_key.get(), point.get()) != 1) {
    CryptoFailure("EC_KEY_set_public_key");
  }
  return ECDSA_do_verify(digest.data(), static_cast<int>(digest.size()), sig.get(),
                         ec_key.get()) == 1;
}

SharedSecret DeriveSharedSecret(const PrivateKey& private_key, const PublicKey& public_key) {
  UniqueBnCtx ctx(BN_CTX_secure_new());
  if (!ctx) {
    CryptoFailure("BN_CTX_secure_new");
  }
  auto peer = DecodePoint(public_key.Compressed(), ctx.get());
  if (!peer) {
    ThrowError(ErrorKind::kInvalidKey, "public key is not a valid secp256k1 point");
  }
  UniqueEcPoint shared(EC_POINT_new(Curve()));
  if (!shared) {
    CryptoFailure("EC_POINT_new");
  }
  // Single-point multiplication uses OpenSSL's Montgomery ladder, which runs
  // in constant time for a BN_FLG_CONSTTIME scalar.
  auto scalar = ScalarFromBytes(private_key.Secret());
  if (EC_POINT_mul(Curve(), shared.get(), nullptr, peer.get(), scalar.get(), ctx.get()) != 1) {
    CryptoFailure("EC_POINT_mul");
  }
  auto compressed = EncodeCompressed(shared.get(), ctx.get());
  const SharedSecret secret = Sha256(compressed);
  util::SecureWipe(compressed);
  return secret;
}

}  // namespace sealnode::crypto
